#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace runbox::runtime {

class RuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SandboxHandle {
    std::string id;

    bool operator==(const SandboxHandle& other) const { return id == other.id; }
    bool operator!=(const SandboxHandle& other) const { return id != other.id; }
};

struct ResourceLimits {
    long cpu_quota = 50000;
    long cpu_period = 100000;
    std::string memory = "128m";
    bool network_disabled = true;
};

struct Mount {
    std::string host_path;
    std::string container_path;
    bool read_only = true;
};

struct CreateOptions {
    std::string image;
    std::vector<std::string> command;
    ResourceLimits limits;
    std::vector<Mount> mounts;
    std::string working_dir;
};

struct ExecOutput {
    int exit_code = -1;
    std::string output;
};

enum class SandboxState {
    kCreated,
    kRunning,
    kPaused,
    kRestarting,
    kExited,
    kDead,
    kUnknown
};

SandboxState ParseSandboxState(const std::string& value);
const char* ToString(SandboxState state);

// Container runtime capability consumed by the lifecycle manager.
// Every method throws RuntimeError on failure, including calls on a handle
// that has already been removed.
class RuntimeClient {
public:
    virtual ~RuntimeClient() = default;

    // Creates and starts a sandbox.
    virtual SandboxHandle Create(const CreateOptions& options) = 0;
    // Extracts a tar archive into path inside the sandbox.
    virtual void InjectArchive(const SandboxHandle& sandbox,
                               const std::string& path,
                               const std::string& archive) = 0;
    // Runs command inside a running sandbox. A detached exec returns as soon
    // as the process is started and carries no exit code or output.
    virtual ExecOutput Exec(const SandboxHandle& sandbox,
                            const std::vector<std::string>& command,
                            const std::string& working_dir,
                            bool detached) = 0;
    // Blocks until the sandbox's main process exits and returns its exit code.
    virtual int Wait(const SandboxHandle& sandbox) = 0;
    virtual SandboxState Status(const SandboxHandle& sandbox) = 0;
    virtual std::string Logs(const SandboxHandle& sandbox) = 0;
    virtual void Stop(const SandboxHandle& sandbox) = 0;
    virtual void Remove(const SandboxHandle& sandbox) = 0;
};

}  // namespace runbox::runtime
