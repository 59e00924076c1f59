#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "runtime/runtime_client.hpp"
#include "utils/errors.hpp"

namespace runbox::sandbox {

struct PrewarmResult {
    std::optional<Error> error;
    std::string status;
};

// Reserve of idle, already running sandboxes. A handle leaves the pool at
// most once: through Acquire (the caller then owns its release) or Drain.
class WarmPool {
public:
    WarmPool(runtime::RuntimeClient& runtime,
             runtime::CreateOptions idle_options,
             std::size_t target_size);
    ~WarmPool();

    WarmPool(const WarmPool&) = delete;
    WarmPool& operator=(const WarmPool&) = delete;

    std::optional<runtime::SandboxHandle> Acquire();

    // Starts a background fill unless one is already running. Never blocks on
    // the runtime.
    void ReplenishAsync();

    // Creates idle sandboxes until the pool (plus in-flight creations) reaches
    // the target size. Stops at the first creation failure.
    std::size_t FillToTarget();

    // Adds a single idle sandbox unless the pool is already full.
    PrewarmResult Prewarm();

    // Stops and removes every pooled sandbox. Further fills are refused.
    void Drain();

    std::size_t Size() const;
    std::size_t TargetSize() const { return target_size_; }

private:
    bool ReserveSlot();
    // Returns false when the handle was not kept (pool full or draining).
    bool Deposit(const runtime::SandboxHandle& sandbox);
    void Destroy(const runtime::SandboxHandle& sandbox);

    runtime::RuntimeClient& runtime_;
    runtime::CreateOptions idle_options_;
    const std::size_t target_size_;

    mutable std::mutex mutex_;
    std::deque<runtime::SandboxHandle> idle_;
    std::size_t pending_ = 0;
    bool draining_ = false;

    std::mutex replenish_mutex_;
    std::thread replenisher_;
    std::atomic<bool> replenishing_{false};
};

}  // namespace runbox::sandbox
