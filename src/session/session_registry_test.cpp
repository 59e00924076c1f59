#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "session/session_registry.hpp"

namespace runbox::session {
namespace {

using TimePoint = std::chrono::steady_clock::time_point;

TEST(SessionRegistryTest, CreateStampsCreationTime) {
    TimePoint now{std::chrono::seconds(100)};
    SessionRegistry registry([&now] { return now; });

    const auto created = registry.Create("s1", runtime::SandboxHandle{"c1"}, SessionMode::kScript);
    EXPECT_EQ(created.created_at, now);
    EXPECT_EQ(created.state, SessionState::kRunning);

    const auto fetched = registry.Get("s1");
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->sandbox.id, "c1");
    EXPECT_EQ(fetched->mode, SessionMode::kScript);
    EXPECT_FALSE(fetched->sandbox_released);
}

TEST(SessionRegistryTest, DuplicateIdIsRejected) {
    SessionRegistry registry;
    registry.Create("s1", runtime::SandboxHandle{"c1"}, SessionMode::kScript);
    EXPECT_THROW(registry.Create("s1", runtime::SandboxHandle{"c2"}, SessionMode::kTest), std::logic_error);
    EXPECT_EQ(registry.Get("s1")->sandbox.id, "c1");
}

TEST(SessionRegistryTest, DeleteIsIdempotent) {
    SessionRegistry registry;
    registry.Create("s1", runtime::SandboxHandle{"c1"}, SessionMode::kScript);

    const auto removed = registry.Delete("s1");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->id, "s1");
    EXPECT_FALSE(registry.Delete("s1").has_value());
    EXPECT_FALSE(registry.Get("s1").has_value());
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(SessionRegistryTest, MarkCompleted) {
    SessionRegistry registry;
    registry.Create("s1", runtime::SandboxHandle{"c1"}, SessionMode::kScript);
    EXPECT_TRUE(registry.MarkCompleted("s1"));
    EXPECT_EQ(registry.Get("s1")->state, SessionState::kCompleted);
    EXPECT_FALSE(registry.MarkCompleted("missing"));
}

TEST(SessionRegistryTest, ListAllIsASnapshot) {
    SessionRegistry registry;
    registry.Create("s1", runtime::SandboxHandle{"c1"}, SessionMode::kScript);
    registry.Create("s2", runtime::SandboxHandle{"c2"}, SessionMode::kTest);

    const auto snapshot = registry.ListAll();
    registry.Delete("s1");
    EXPECT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(SessionRegistryTest, ConcurrentDeleteRemovesOnce) {
    SessionRegistry registry;
    registry.Create("s1", runtime::SandboxHandle{"c1"}, SessionMode::kScript);

    std::atomic<int> removed{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&] {
            if (registry.Delete("s1")) {
                ++removed;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(removed.load(), 1);
}

}  // namespace
}  // namespace runbox::session
