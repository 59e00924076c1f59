#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "runtime/runtime_client.hpp"
#include "sandbox/code_stager.hpp"
#include "sandbox/warm_pool.hpp"
#include "session/session_registry.hpp"
#include "utils/errors.hpp"

namespace runbox::executor {

struct SubmitResult {
    std::optional<Error> error;
    std::string session_id;
};

struct TestRunResponse {
    std::optional<Error> error;
    std::string session_id;
    session::TestRunResult result;
};

struct PollResult {
    std::optional<Error> error;
    bool running = false;
    std::string logs;
};

struct CleanupResult {
    std::optional<Error> error;
    std::string status;
};

// Options shared by every sandbox: image, resource limits, working directory.
runtime::CreateOptions BaseCreateOptions(const config::Config& config);
// Options for an idle pooled sandbox.
runtime::CreateOptions IdleSandboxOptions(const config::Config& config);

class ExecutionDispatcher {
public:
    ExecutionDispatcher(const config::Config& config,
                        runtime::RuntimeClient& runtime,
                        sandbox::WarmPool& pool,
                        sandbox::CodeStager& stager,
                        session::SessionRegistry& registry);

    // Starts a single script detached and records a running session.
    SubmitResult SubmitScript(const std::vector<sandbox::SourceFile>& files);
    // Runs the test files synchronously; the sandbox is released before return.
    TestRunResponse SubmitTests(const std::vector<sandbox::SourceFile>& files);
    PollResult Poll(const std::string& session_id);
    CleanupResult Cleanup(const std::string& session_id);
    sandbox::PrewarmResult Prewarm();

    bool IsScriptFile(const std::string& name) const;
    bool IsTestFile(const std::string& name) const;

    std::string BuildScriptCommand(const std::string& entry) const;
    std::string BuildTestCommand(const std::vector<std::string>& test_files) const;

private:
    struct RunOutput {
        int exit_code = -1;
        std::string output;
    };

    std::optional<Error> RunTestsPooled(const runtime::SandboxHandle& sandbox,
                                        const std::vector<sandbox::SourceFile>& files,
                                        const std::string& command,
                                        RunOutput& out);
    std::optional<Error> RunTestsFresh(const std::vector<sandbox::SourceFile>& files,
                                       const std::string& command,
                                       runtime::SandboxHandle& sandbox,
                                       RunOutput& out);
    runtime::CreateOptions FreshOptions(std::vector<std::string> command,
                                        const sandbox::StagingArea& staging) const;
    std::string TestNamingHint() const;

    const config::Config& config_;
    runtime::RuntimeClient& runtime_;
    sandbox::WarmPool& pool_;
    sandbox::CodeStager& stager_;
    session::SessionRegistry& registry_;
};

}  // namespace runbox::executor
