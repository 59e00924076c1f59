#include "sandbox/warm_pool.hpp"

#include <vector>

#include "utils/logging.hpp"

namespace runbox::sandbox {

WarmPool::WarmPool(runtime::RuntimeClient& runtime,
                   runtime::CreateOptions idle_options,
                   std::size_t target_size)
    : runtime_(runtime)
    , idle_options_(std::move(idle_options))
    , target_size_(target_size) {}

WarmPool::~WarmPool() {
    std::lock_guard<std::mutex> lock(replenish_mutex_);
    if (replenisher_.joinable()) {
        replenisher_.join();
    }
}

std::optional<runtime::SandboxHandle> WarmPool::Acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.empty()) {
        return std::nullopt;
    }
    auto sandbox = idle_.front();
    idle_.pop_front();
    return sandbox;
}

void WarmPool::ReplenishAsync() {
    std::lock_guard<std::mutex> lock(replenish_mutex_);
    if (replenishing_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> pool_lock(mutex_);
        if (draining_) {
            replenishing_ = false;
            return;
        }
    }
    // The previous fill has finished (replenishing_ was false); reap it.
    if (replenisher_.joinable()) {
        replenisher_.join();
    }
    replenisher_ = std::thread([this]() {
        FillToTarget();
        replenishing_ = false;
    });
}

bool WarmPool::ReserveSlot() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (draining_ || idle_.size() + pending_ >= target_size_) {
        return false;
    }
    ++pending_;
    return true;
}

bool WarmPool::Deposit(const runtime::SandboxHandle& sandbox) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (draining_ || idle_.size() >= target_size_) {
        return false;
    }
    idle_.push_back(sandbox);
    return true;
}

std::size_t WarmPool::FillToTarget() {
    std::size_t created = 0;
    while (ReserveSlot()) {
        std::optional<runtime::SandboxHandle> sandbox;
        try {
            sandbox = runtime_.Create(idle_options_);
        } catch (const runtime::RuntimeError& ex) {
            utils::Log(utils::LogLevel::kWarn, "pool", std::string("failed to create sandbox: ") + ex.what());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --pending_;
        }
        if (!sandbox) {
            break;
        }
        if (!Deposit(*sandbox)) {
            Destroy(*sandbox);
            break;
        }
        ++created;
        utils::Log(utils::LogLevel::kInfo, "pool", "sandbox created id=" + sandbox->id);
    }
    return created;
}

PrewarmResult WarmPool::Prewarm() {
    PrewarmResult result{};
    if (!ReserveSlot()) {
        result.status = "Prewarm pool already at maximum size";
        return result;
    }
    std::optional<runtime::SandboxHandle> sandbox;
    try {
        sandbox = runtime_.Create(idle_options_);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kError, "pool", std::string("prewarm failed: ") + ex.what());
        result.error = Error{ErrorKind::kRuntimeCreation, std::string("Failed to prewarm container: ") + ex.what()};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_;
    }
    if (!sandbox) {
        return result;
    }
    if (!Deposit(*sandbox)) {
        Destroy(*sandbox);
        result.status = "Prewarm pool already at maximum size";
        return result;
    }
    utils::Log(utils::LogLevel::kInfo, "pool", "sandbox prewarmed id=" + sandbox->id);
    result.status = "Container prewarmed successfully";
    return result;
}

void WarmPool::Drain() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        draining_ = true;
    }
    {
        std::lock_guard<std::mutex> lock(replenish_mutex_);
        if (replenisher_.joinable()) {
            replenisher_.join();
        }
    }
    std::deque<runtime::SandboxHandle> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(idle_);
    }
    utils::Log(utils::LogLevel::kInfo, "shutdown",
               "cleaning up " + std::to_string(drained.size()) + " prewarmed sandboxes");
    for (const auto& sandbox : drained) {
        Destroy(sandbox);
    }
}

void WarmPool::Destroy(const runtime::SandboxHandle& sandbox) {
    try {
        runtime_.Stop(sandbox);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kWarn, "pool", "stop " + sandbox.id + " failed: " + ex.what());
    }
    try {
        runtime_.Remove(sandbox);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kWarn, "pool", "remove " + sandbox.id + " failed: " + ex.what());
    }
}

std::size_t WarmPool::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

}  // namespace runbox::sandbox
