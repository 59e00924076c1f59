#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "session/session_types.hpp"
#include "utils/common.hpp"

namespace runbox::session {

// Thread-safe table of live sessions keyed by id.
class SessionRegistry {
public:
    explicit SessionRegistry(utils::Clock clock = utils::SteadyClock());

    // Stamps created_at from the clock and stores the session. Throws
    // std::logic_error if the id is already present.
    Session Create(Session session);
    Session Create(const std::string& id, const runtime::SandboxHandle& sandbox, SessionMode mode);

    std::optional<Session> Get(const std::string& id) const;
    // Removes and returns the session; nullopt when absent, so a repeated
    // delete is a no-op.
    std::optional<Session> Delete(const std::string& id);
    // Returns false if the session no longer exists.
    bool MarkCompleted(const std::string& id);
    // Point-in-time copy; safe to iterate while others mutate the registry.
    std::vector<Session> ListAll() const;
    std::size_t Size() const;

private:
    utils::Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
};

}  // namespace runbox::session
