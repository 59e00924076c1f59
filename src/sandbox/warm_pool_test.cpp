#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/mock_runtime_client.hpp"
#include "sandbox/warm_pool.hpp"

namespace runbox::sandbox {
namespace {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Throw;

class WarmPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(runtime_, Create(_)).WillByDefault(Invoke([this](const runtime::CreateOptions&) {
            return runtime::SandboxHandle{"c" + std::to_string(++created_)};
        }));
    }

    NiceMock<runtime::MockRuntimeClient> runtime_;
    std::atomic<int> created_{0};
};

TEST_F(WarmPoolTest, FillToTargetCreatesIdleSandboxes) {
    runtime::CreateOptions options{};
    options.command = {"sleep", "infinity"};
    EXPECT_CALL(runtime_, Create(::testing::Field(&runtime::CreateOptions::command, options.command)))
        .Times(3);

    WarmPool pool(runtime_, options, 3);
    EXPECT_EQ(pool.FillToTarget(), 3u);
    EXPECT_EQ(pool.Size(), 3u);
    EXPECT_EQ(pool.FillToTarget(), 0u);
}

TEST_F(WarmPoolTest, AcquireIsFifoAndEmptyYieldsNothing) {
    WarmPool pool(runtime_, {}, 2);
    pool.FillToTarget();

    EXPECT_EQ(pool.Acquire()->id, "c1");
    EXPECT_EQ(pool.Acquire()->id, "c2");
    EXPECT_FALSE(pool.Acquire().has_value());
}

TEST_F(WarmPoolTest, ConcurrentAcquiresGetDistinctSandboxes) {
    constexpr std::size_t kSize = 8;
    WarmPool pool(runtime_, {}, kSize);
    pool.FillToTarget();

    std::mutex mutex;
    std::multiset<std::string> acquired;
    std::atomic<int> misses{0};
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < kSize + 4; ++i) {
        workers.emplace_back([&] {
            auto sandbox = pool.Acquire();
            if (!sandbox) {
                ++misses;
                return;
            }
            std::lock_guard<std::mutex> lock(mutex);
            acquired.insert(sandbox->id);
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(acquired.size(), kSize);
    EXPECT_EQ(std::set<std::string>(acquired.begin(), acquired.end()).size(), kSize);
    EXPECT_EQ(misses.load(), 4);
}

TEST_F(WarmPoolTest, ConcurrentFillsNeverExceedTarget) {
    WarmPool pool(runtime_, {}, 2);

    std::vector<std::thread> workers;
    for (int i = 0; i < 6; ++i) {
        workers.emplace_back([&] { pool.FillToTarget(); });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(pool.Size(), 2u);
    EXPECT_EQ(created_.load(), 2);
}

TEST_F(WarmPoolTest, CreationFailureStopsFill) {
    EXPECT_CALL(runtime_, Create(_)).WillOnce(Throw(runtime::RuntimeError("image not found")));

    WarmPool pool(runtime_, {}, 3);
    EXPECT_EQ(pool.FillToTarget(), 0u);
    EXPECT_EQ(pool.Size(), 0u);
}

TEST_F(WarmPoolTest, ZeroTargetNeverCreates) {
    EXPECT_CALL(runtime_, Create(_)).Times(0);
    WarmPool pool(runtime_, {}, 0);
    EXPECT_EQ(pool.FillToTarget(), 0u);
    EXPECT_EQ(pool.Prewarm().status, "Prewarm pool already at maximum size");
}

TEST_F(WarmPoolTest, PrewarmAddsOneUntilFull) {
    WarmPool pool(runtime_, {}, 1);

    const auto first = pool.Prewarm();
    EXPECT_FALSE(first.error.has_value());
    EXPECT_EQ(first.status, "Container prewarmed successfully");
    EXPECT_EQ(pool.Size(), 1u);

    const auto second = pool.Prewarm();
    EXPECT_FALSE(second.error.has_value());
    EXPECT_EQ(second.status, "Prewarm pool already at maximum size");
    EXPECT_EQ(pool.Size(), 1u);
}

TEST_F(WarmPoolTest, PrewarmReportsCreationFailure) {
    EXPECT_CALL(runtime_, Create(_)).WillOnce(Throw(runtime::RuntimeError("daemon down")));

    WarmPool pool(runtime_, {}, 1);
    const auto result = pool.Prewarm();
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kRuntimeCreation);
    EXPECT_EQ(result.error->message, "Failed to prewarm container: daemon down");
    EXPECT_EQ(pool.Size(), 0u);
}

TEST_F(WarmPoolTest, DrainStopsAndRemovesEverySandbox) {
    WarmPool pool(runtime_, {}, 2);
    pool.FillToTarget();

    EXPECT_CALL(runtime_, Stop(runtime::SandboxHandle{"c1"})).Times(1);
    EXPECT_CALL(runtime_, Remove(runtime::SandboxHandle{"c1"})).Times(1);
    EXPECT_CALL(runtime_, Stop(runtime::SandboxHandle{"c2"})).Times(1);
    EXPECT_CALL(runtime_, Remove(runtime::SandboxHandle{"c2"})).Times(1);

    pool.Drain();
    EXPECT_EQ(pool.Size(), 0u);
    EXPECT_FALSE(pool.Acquire().has_value());
}

TEST_F(WarmPoolTest, DrainContinuesPastFailures) {
    WarmPool pool(runtime_, {}, 2);
    pool.FillToTarget();

    EXPECT_CALL(runtime_, Stop(runtime::SandboxHandle{"c1"})).WillOnce(Throw(runtime::RuntimeError("gone")));
    EXPECT_CALL(runtime_, Remove(runtime::SandboxHandle{"c1"})).Times(1);
    EXPECT_CALL(runtime_, Stop(runtime::SandboxHandle{"c2"})).Times(1);
    EXPECT_CALL(runtime_, Remove(runtime::SandboxHandle{"c2"})).Times(1);

    pool.Drain();
}

TEST_F(WarmPoolTest, DrainedPoolRefusesRefill) {
    WarmPool pool(runtime_, {}, 2);
    pool.Drain();

    EXPECT_CALL(runtime_, Create(_)).Times(0);
    EXPECT_EQ(pool.FillToTarget(), 0u);
    pool.ReplenishAsync();
    EXPECT_EQ(pool.Size(), 0u);
}

TEST_F(WarmPoolTest, ReplenishAsyncFillsInBackground) {
    WarmPool pool(runtime_, {}, 2);
    pool.ReplenishAsync();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pool.Size() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(pool.Size(), 2u);

    pool.Acquire();
    pool.ReplenishAsync();
    pool.Drain();
    EXPECT_LE(created_.load(), 3);
}

}  // namespace
}  // namespace runbox::sandbox
