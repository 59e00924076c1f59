#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "runtime/runtime_client.hpp"

namespace runbox::runtime {

// RuntimeClient backed by the docker command line.
class DockerRuntime : public RuntimeClient {
public:
    explicit DockerRuntime(config::RuntimeConfig config);

    SandboxHandle Create(const CreateOptions& options) override;
    void InjectArchive(const SandboxHandle& sandbox,
                       const std::string& path,
                       const std::string& archive) override;
    ExecOutput Exec(const SandboxHandle& sandbox,
                    const std::vector<std::string>& command,
                    const std::string& working_dir,
                    bool detached) override;
    int Wait(const SandboxHandle& sandbox) override;
    SandboxState Status(const SandboxHandle& sandbox) override;
    std::string Logs(const SandboxHandle& sandbox) override;
    void Stop(const SandboxHandle& sandbox) override;
    void Remove(const SandboxHandle& sandbox) override;

    static std::vector<std::string> BuildCreateArgs(const CreateOptions& options);

private:
    struct CommandResult {
        int exit_code = -1;
        std::string output;
        std::string error;
    };

    // Runs docker with args; with merge_output stderr is folded into output.
    CommandResult RunDocker(const std::vector<std::string>& args,
                            const std::string* input = nullptr,
                            bool merge_output = false) const;
    CommandResult RunChecked(const std::vector<std::string>& args,
                             const std::string* input = nullptr) const;

    config::RuntimeConfig config_;
};

}  // namespace runbox::runtime
