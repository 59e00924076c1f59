#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

#include "runtime/runtime_client.hpp"
#include "sandbox/warm_pool.hpp"
#include "session/session_registry.hpp"
#include "utils/common.hpp"

namespace runbox::sweeper {

// Periodically reclaims sessions older than the timeout and tops up the pool.
class ExpirationSweeper {
public:
    ExpirationSweeper(
        session::SessionRegistry& registry,
        runtime::RuntimeClient& runtime,
        sandbox::WarmPool& pool,
        std::chrono::milliseconds interval,
        std::chrono::milliseconds timeout,
        utils::Clock clock = utils::SteadyClock());
    ~ExpirationSweeper();

    void Start();
    void Stop();
    bool IsRunning() const;

    // One sweep pass; returns the number of sessions reclaimed.
    std::size_t SweepOnce();

private:
    void RunLoop();

    session::SessionRegistry& registry_;
    runtime::RuntimeClient& runtime_;
    sandbox::WarmPool& pool_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds timeout_;
    utils::Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::thread worker_;
};

}  // namespace runbox::sweeper
