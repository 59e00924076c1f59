#include <atomic>
#include <cstdlib>
#include <optional>
#include <string>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/docker_runtime.hpp"
#include "runtime/mock_runtime_client.hpp"
#include "sweeper/expiration_sweeper.hpp"

namespace runbox::sweeper {
namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

using TimePoint = std::chrono::steady_clock::time_point;

// Manually advanced clock shared by the registry and the sweeper.
class FakeClock {
public:
    utils::Clock AsClock() {
        return [this] {
            std::lock_guard<std::mutex> lock(mutex_);
            return now_;
        };
    }

    void Advance(std::chrono::milliseconds step) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += step;
    }

private:
    std::mutex mutex_;
    TimePoint now_{std::chrono::seconds(1000)};
};

class ExpirationSweeperTest : public ::testing::Test {
protected:
    NiceMock<runtime::MockRuntimeClient> runtime_;
    FakeClock clock_;
    session::SessionRegistry registry_{clock_.AsClock()};
    // Target 0 keeps the replenish step from touching the runtime.
    sandbox::WarmPool pool_{runtime_, {}, 0};
    ExpirationSweeper sweeper_{registry_, runtime_, pool_,
                               std::chrono::milliseconds(10), std::chrono::seconds(10), clock_.AsClock()};
};

TEST_F(ExpirationSweeperTest, KeepsSessionsWithinTimeout) {
    registry_.Create("s1", runtime::SandboxHandle{"c1"}, session::SessionMode::kScript);
    clock_.Advance(std::chrono::seconds(10));

    EXPECT_CALL(runtime_, Stop(_)).Times(0);
    EXPECT_EQ(sweeper_.SweepOnce(), 0u);
    EXPECT_TRUE(registry_.Get("s1").has_value());
}

TEST_F(ExpirationSweeperTest, ReclaimsExpiredSessionExactlyOnce) {
    registry_.Create("old", runtime::SandboxHandle{"c1"}, session::SessionMode::kScript);
    clock_.Advance(std::chrono::seconds(8));
    registry_.Create("young", runtime::SandboxHandle{"c2"}, session::SessionMode::kScript);
    clock_.Advance(std::chrono::seconds(3));

    EXPECT_CALL(runtime_, Stop(runtime::SandboxHandle{"c1"})).Times(1);
    EXPECT_CALL(runtime_, Remove(runtime::SandboxHandle{"c1"})).Times(1);
    EXPECT_CALL(runtime_, Stop(runtime::SandboxHandle{"c2"})).Times(0);

    EXPECT_EQ(sweeper_.SweepOnce(), 1u);
    EXPECT_EQ(sweeper_.SweepOnce(), 0u);
    EXPECT_FALSE(registry_.Get("old").has_value());
    EXPECT_TRUE(registry_.Get("young").has_value());
}

TEST_F(ExpirationSweeperTest, ReleasedSessionsAreForgottenWithoutRuntimeCalls) {
    session::Session session{};
    session.id = "t1";
    session.sandbox = runtime::SandboxHandle{"c1"};
    session.mode = session::SessionMode::kTest;
    session.state = session::SessionState::kCompleted;
    session.sandbox_released = true;
    registry_.Create(session);
    clock_.Advance(std::chrono::seconds(11));

    EXPECT_CALL(runtime_, Stop(_)).Times(0);
    EXPECT_CALL(runtime_, Remove(_)).Times(0);
    EXPECT_EQ(sweeper_.SweepOnce(), 1u);
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(ExpirationSweeperTest, RuntimeFailuresDoNotStopTheSweep) {
    registry_.Create("s1", runtime::SandboxHandle{"c1"}, session::SessionMode::kScript);
    registry_.Create("s2", runtime::SandboxHandle{"c2"}, session::SessionMode::kScript);
    clock_.Advance(std::chrono::seconds(20));

    EXPECT_CALL(runtime_, Stop(_)).WillRepeatedly(Throw(runtime::RuntimeError("No such container")));
    EXPECT_CALL(runtime_, Remove(_)).Times(2);

    EXPECT_EQ(sweeper_.SweepOnce(), 2u);
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(ExpirationSweeperTest, ConcurrentSweepsReleaseEachSandboxOnce) {
    for (int i = 0; i < 16; ++i) {
        registry_.Create("s" + std::to_string(i),
                         runtime::SandboxHandle{"c" + std::to_string(i)},
                         session::SessionMode::kScript);
    }
    clock_.Advance(std::chrono::seconds(30));

    EXPECT_CALL(runtime_, Stop(_)).Times(16);
    EXPECT_CALL(runtime_, Remove(_)).Times(16);

    std::atomic<std::size_t> reclaimed{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&] { reclaimed += sweeper_.SweepOnce(); });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(reclaimed.load(), 16u);
}

TEST_F(ExpirationSweeperTest, BackgroundLoopReclaimsAndStops) {
    registry_.Create("s1", runtime::SandboxHandle{"c1"}, session::SessionMode::kScript);
    clock_.Advance(std::chrono::seconds(11));
    EXPECT_CALL(runtime_, Stop(runtime::SandboxHandle{"c1"})).Times(1);
    EXPECT_CALL(runtime_, Remove(runtime::SandboxHandle{"c1"})).Times(1);

    sweeper_.Start();
    EXPECT_TRUE(sweeper_.IsRunning());
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (registry_.Size() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    sweeper_.Stop();

    EXPECT_FALSE(sweeper_.IsRunning());
    EXPECT_EQ(registry_.Size(), 0u);
    sweeper_.Stop();
}


// Points TMPDIR at a missing directory for the lifetime of the object.
class ScopedMissingTempDir {
public:
    ScopedMissingTempDir() {
        if (const char* previous = std::getenv("TMPDIR")) {
            previous_ = std::string(previous);
        }
        setenv("TMPDIR", "/nonexistent-runbox-tmp", 1);
    }
    ~ScopedMissingTempDir() {
        if (previous_) {
            setenv("TMPDIR", previous_->c_str(), 1);
        } else {
            unsetenv("TMPDIR");
        }
    }

private:
    std::optional<std::string> previous_;
};

TEST(ExpirationSweeperDockerTest, HostFaultsDuringReclaimAreContained) {
    FakeClock clock;
    session::SessionRegistry registry(clock.AsClock());
    runtime::DockerRuntime runtime(config::RuntimeConfig{});
    sandbox::WarmPool pool(runtime, {}, 0);
    ExpirationSweeper sweeper(registry, runtime, pool,
                              std::chrono::milliseconds(10), std::chrono::seconds(1), clock.AsClock());
    registry.Create("s1", runtime::SandboxHandle{"c1"}, session::SessionMode::kScript);
    registry.Create("s2", runtime::SandboxHandle{"c2"}, session::SessionMode::kScript);
    clock.Advance(std::chrono::seconds(5));

    ScopedMissingTempDir missing_tmp;
    EXPECT_THROW(runtime.Stop(runtime::SandboxHandle{"c1"}), runtime::RuntimeError);
    EXPECT_EQ(sweeper.SweepOnce(), 2u);
    EXPECT_EQ(registry.Size(), 0u);

    registry.Create("s3", runtime::SandboxHandle{"c3"}, session::SessionMode::kScript);
    clock.Advance(std::chrono::seconds(5));
    sweeper.Start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (registry.Size() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    sweeper.Stop();
    EXPECT_EQ(registry.Size(), 0u);
}

}  // namespace
}  // namespace runbox::sweeper
