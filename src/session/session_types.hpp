#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "runtime/runtime_client.hpp"
#include "sandbox/code_stager.hpp"

namespace runbox::session {

enum class SessionMode {
    kScript,
    kTest
};

enum class SessionState {
    kCreated,
    kRunning,
    kCompleted
};

inline const char* ToString(SessionMode mode) {
    return mode == SessionMode::kScript ? "script" : "test";
}

inline const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::kCreated: return "created";
        case SessionState::kRunning: return "running";
        case SessionState::kCompleted: return "completed";
    }
    return "unknown";
}

struct TestSummary {
    long long passed = 0;
    long long failed = 0;
    long long total = 0;
    double duration = 0.0;
};

struct TestRunResult {
    std::string status;
    int exit_code = -1;
    std::optional<TestSummary> summary;
    std::string raw_output;
};

struct Session {
    std::string id;
    runtime::SandboxHandle sandbox;
    std::chrono::steady_clock::time_point created_at;
    SessionMode mode = SessionMode::kScript;
    SessionState state = SessionState::kCreated;
    // Set once the sandbox has been stopped and removed.
    bool sandbox_released = false;
    std::optional<TestRunResult> result;
    // Backs the bind mount of a freshly created sandbox.
    std::shared_ptr<sandbox::StagingArea> staging;
};

}  // namespace runbox::session
