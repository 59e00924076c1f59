#include "sweeper/expiration_sweeper.hpp"

#include <string>

#include "utils/logging.hpp"

namespace runbox::sweeper {

ExpirationSweeper::ExpirationSweeper(
    session::SessionRegistry& registry,
    runtime::RuntimeClient& runtime,
    sandbox::WarmPool& pool,
    std::chrono::milliseconds interval,
    std::chrono::milliseconds timeout,
    utils::Clock clock)
    : registry_(registry)
    , runtime_(runtime)
    , pool_(pool)
    , interval_(interval)
    , timeout_(timeout)
    , clock_(std::move(clock)) {}

ExpirationSweeper::~ExpirationSweeper() {
    Stop();
}

void ExpirationSweeper::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }
    worker_ = std::thread([this]() { RunLoop(); });
}

void ExpirationSweeper::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool ExpirationSweeper::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void ExpirationSweeper::RunLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
                break;
            }
        }
        SweepOnce();
    }
}

std::size_t ExpirationSweeper::SweepOnce() {
    const auto now = clock_();
    std::size_t reclaimed = 0;
    for (const auto& snapshot : registry_.ListAll()) {
        if (now - snapshot.created_at <= timeout_) {
            continue;
        }
        // Another thread may have cleaned it up since the snapshot.
        const auto session = registry_.Delete(snapshot.id);
        if (!session) {
            continue;
        }
        ++reclaimed;
        if (!session->sandbox_released) {
            try {
                runtime_.Stop(session->sandbox);
            } catch (const runtime::RuntimeError& ex) {
                utils::Log(utils::LogLevel::kDebug, "sweeper", "stop " + session->sandbox.id + ": " + ex.what());
            }
            try {
                runtime_.Remove(session->sandbox);
            } catch (const runtime::RuntimeError& ex) {
                utils::Log(utils::LogLevel::kDebug, "sweeper", "remove " + session->sandbox.id + ": " + ex.what());
            }
        }
        utils::Log(utils::LogLevel::kInfo, "sweeper", session->id + " timed_out");
    }
    pool_.ReplenishAsync();
    return reclaimed;
}

}  // namespace runbox::sweeper
