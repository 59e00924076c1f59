#include "session/session_registry.hpp"

#include <stdexcept>

namespace runbox::session {

SessionRegistry::SessionRegistry(utils::Clock clock)
    : clock_(std::move(clock)) {}

Session SessionRegistry::Create(Session session) {
    session.created_at = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = sessions_.emplace(session.id, session);
    if (!inserted) {
        throw std::logic_error("duplicate session id: " + session.id);
    }
    return it->second;
}

Session SessionRegistry::Create(const std::string& id,
                                const runtime::SandboxHandle& sandbox,
                                SessionMode mode) {
    Session session{};
    session.id = id;
    session.sandbox = sandbox;
    session.mode = mode;
    session.state = SessionState::kRunning;
    return Create(std::move(session));
}

std::optional<Session> SessionRegistry::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Session> SessionRegistry::Delete(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

bool SessionRegistry::MarkCompleted(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.state = SessionState::kCompleted;
    return true;
}

std::vector<Session> SessionRegistry::ListAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Session> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& item : sessions_) {
        sessions.push_back(item.second);
    }
    return sessions;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace runbox::session
