#include "runtime/runtime_client.hpp"

namespace runbox::runtime {

SandboxState ParseSandboxState(const std::string& value) {
    if (value == "created") {
        return SandboxState::kCreated;
    }
    if (value == "running") {
        return SandboxState::kRunning;
    }
    if (value == "paused") {
        return SandboxState::kPaused;
    }
    if (value == "restarting") {
        return SandboxState::kRestarting;
    }
    if (value == "exited") {
        return SandboxState::kExited;
    }
    if (value == "dead") {
        return SandboxState::kDead;
    }
    return SandboxState::kUnknown;
}

const char* ToString(SandboxState state) {
    switch (state) {
        case SandboxState::kCreated: return "created";
        case SandboxState::kRunning: return "running";
        case SandboxState::kPaused: return "paused";
        case SandboxState::kRestarting: return "restarting";
        case SandboxState::kExited: return "exited";
        case SandboxState::kDead: return "dead";
        case SandboxState::kUnknown: return "unknown";
    }
    return "unknown";
}

}  // namespace runbox::runtime
