#include "executor/execution_dispatcher.hpp"

#include <set>
#include <utility>

#include "executor/test_report.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::executor {
namespace {

constexpr const char* kReportPath = "/tmp/runbox-report.json";

// Best-effort stop+remove. Remove is attempted even when stop fails; the first
// failure is returned.
std::optional<Error> ReleaseSandbox(runtime::RuntimeClient& runtime, const runtime::SandboxHandle& sandbox) {
    std::optional<Error> error;
    try {
        runtime.Stop(sandbox);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kWarn, "dispatch", "stop " + sandbox.id + " failed: " + ex.what());
        error = Error{ErrorKind::kReclaim, ex.what()};
    }
    try {
        runtime.Remove(sandbox);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kWarn, "dispatch", "remove " + sandbox.id + " failed: " + ex.what());
        if (!error) {
            error = Error{ErrorKind::kReclaim, ex.what()};
        }
    }
    return error;
}

// Releases the sandbox when it goes out of scope unless ownership has been
// handed to a session.
class SandboxLease {
public:
    SandboxLease(runtime::RuntimeClient& runtime, runtime::SandboxHandle sandbox)
        : runtime_(runtime), sandbox_(std::move(sandbox)) {}
    ~SandboxLease() {
        if (owned_) {
            ReleaseSandbox(runtime_, sandbox_);
        }
    }

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    const runtime::SandboxHandle& Get() const { return sandbox_; }
    void Disown() { owned_ = false; }

private:
    runtime::RuntimeClient& runtime_;
    runtime::SandboxHandle sandbox_;
    bool owned_ = true;
};

std::optional<Error> SanitizeAll(const std::vector<sandbox::SourceFile>& files,
                                 std::vector<std::string>& names) {
    std::set<std::string> seen;
    for (const auto& file : files) {
        const auto name = sandbox::CodeStager::SanitizeName(file.name);
        if (!name) {
            return Error{ErrorKind::kValidation, "Invalid file name: " + file.name};
        }
        if (!seen.insert(*name).second) {
            return Error{ErrorKind::kValidation, "Duplicate file name: " + *name};
        }
        names.push_back(*name);
    }
    return std::nullopt;
}

}  // namespace

runtime::CreateOptions BaseCreateOptions(const config::Config& config) {
    runtime::CreateOptions options{};
    options.image = config.runtime.image;
    options.limits.cpu_quota = config.runtime.cpu_quota;
    options.limits.cpu_period = config.runtime.cpu_period;
    options.limits.memory = config.runtime.memory_limit;
    options.limits.network_disabled = config.runtime.network_disabled;
    options.working_dir = config.runtime.work_dir;
    return options;
}

runtime::CreateOptions IdleSandboxOptions(const config::Config& config) {
    auto options = BaseCreateOptions(config);
    options.command = config.pool.idle_command;
    return options;
}

ExecutionDispatcher::ExecutionDispatcher(const config::Config& config,
                                         runtime::RuntimeClient& runtime,
                                         sandbox::WarmPool& pool,
                                         sandbox::CodeStager& stager,
                                         session::SessionRegistry& registry)
    : config_(config)
    , runtime_(runtime)
    , pool_(pool)
    , stager_(stager)
    , registry_(registry) {}

bool ExecutionDispatcher::IsScriptFile(const std::string& name) const {
    for (const auto& extension : config_.execution.script_extensions) {
        if (name.size() > extension.size() && utils::EndsWith(name, extension)) {
            return true;
        }
    }
    return false;
}

bool ExecutionDispatcher::IsTestFile(const std::string& name) const {
    for (const auto& suffix : config_.execution.test_suffixes) {
        if (utils::EndsWith(name, suffix)) {
            return true;
        }
    }
    for (const auto& prefix : config_.execution.test_prefixes) {
        if (utils::StartsWith(name, prefix)) {
            return true;
        }
    }
    return false;
}

std::string ExecutionDispatcher::TestNamingHint() const {
    return "No test files found (should end with " + utils::Join(config_.execution.test_suffixes, ", ") +
           " or start with " + utils::Join(config_.execution.test_prefixes, ", ") + ")";
}

std::string ExecutionDispatcher::BuildScriptCommand(const std::string& entry) const {
    return config_.execution.interpreter + " " + utils::ShellQuote(entry);
}

std::string ExecutionDispatcher::BuildTestCommand(const std::vector<std::string>& test_files) const {
    std::vector<std::string> quoted;
    quoted.reserve(test_files.size());
    for (const auto& file : test_files) {
        quoted.push_back(utils::ShellQuote(file));
    }
    const std::string report = kReportPath;
    return config_.execution.test_command + " " + utils::Join(quoted, " ") +
           " -p no:cacheprovider --no-header -v --json-report --json-report-file=" + report +
           "; status=$?; if [ -f " + report + " ]; then echo; echo '" + kReportMarker + "'; cat " + report +
           "; fi; exit $status";
}

runtime::CreateOptions ExecutionDispatcher::FreshOptions(std::vector<std::string> command,
                                                         const sandbox::StagingArea& staging) const {
    auto options = BaseCreateOptions(config_);
    options.command = std::move(command);
    options.mounts.push_back(runtime::Mount{staging.Path().string(), config_.runtime.work_dir, true});
    return options;
}

SubmitResult ExecutionDispatcher::SubmitScript(const std::vector<sandbox::SourceFile>& files) {
    SubmitResult result{};
    if (files.empty()) {
        result.error = Error{ErrorKind::kValidation, "No file provided"};
        return result;
    }
    if (files.size() > 1) {
        result.error = Error{ErrorKind::kValidation, "Exactly one file expected"};
        return result;
    }
    std::vector<std::string> names;
    if (auto error = SanitizeAll(files, names)) {
        result.error = error;
        return result;
    }
    const auto& entry = names.front();
    if (!IsScriptFile(entry)) {
        result.error = Error{ErrorKind::kValidation, "Unsupported file type: " + entry};
        return result;
    }

    const auto session_id = utils::GenerateUuid();
    if (auto pooled = pool_.Acquire()) {
        pool_.ReplenishAsync();
        SandboxLease lease(runtime_, *pooled);
        try {
            const auto bundle = stager_.Stage(files);
            if (auto error = stager_.Inject(bundle, lease.Get())) {
                result.error = error;
                return result;
            }
        } catch (const sandbox::StagingError& ex) {
            result.error = Error{ErrorKind::kStaging, ex.what()};
            return result;
        }
        // Output goes to the idle process's streams so it lands in the
        // sandbox log; signalling PID 1 then lets the sandbox exit.
        const auto command = BuildScriptCommand(entry) + " >/proc/1/fd/1 2>/proc/1/fd/2; kill -TERM 1";
        try {
            runtime_.Exec(lease.Get(), {"sh", "-c", command}, stager_.WorkDir(), true);
        } catch (const runtime::RuntimeError& ex) {
            utils::Log(utils::LogLevel::kError, "dispatch", std::string("exec failed: ") + ex.what());
            result.error = Error{ErrorKind::kDispatch, ex.what()};
            return result;
        }
        registry_.Create(session_id, lease.Get(), session::SessionMode::kScript);
        lease.Disown();
        utils::Log(utils::LogLevel::kInfo, "dispatch",
                   "script session=" + session_id + " sandbox=" + lease.Get().id + " pooled=true");
    } else {
        std::shared_ptr<sandbox::StagingArea> staging;
        try {
            staging = stager_.Materialize(files);
        } catch (const sandbox::StagingError& ex) {
            result.error = Error{ErrorKind::kStaging, ex.what()};
            return result;
        }
        runtime::SandboxHandle sandbox;
        try {
            sandbox = runtime_.Create(FreshOptions({"sh", "-c", BuildScriptCommand(entry)}, *staging));
        } catch (const runtime::RuntimeError& ex) {
            utils::Log(utils::LogLevel::kError, "dispatch", std::string("create failed: ") + ex.what());
            result.error = Error{ErrorKind::kRuntimeCreation, ex.what()};
            return result;
        }
        SandboxLease lease(runtime_, sandbox);
        session::Session session{};
        session.id = session_id;
        session.sandbox = sandbox;
        session.mode = session::SessionMode::kScript;
        session.state = session::SessionState::kRunning;
        session.staging = std::move(staging);
        registry_.Create(std::move(session));
        lease.Disown();
        utils::Log(utils::LogLevel::kInfo, "dispatch",
                   "script session=" + session_id + " sandbox=" + sandbox.id + " pooled=false");
    }
    result.session_id = session_id;
    return result;
}

TestRunResponse ExecutionDispatcher::SubmitTests(const std::vector<sandbox::SourceFile>& files) {
    TestRunResponse response{};
    if (files.empty()) {
        response.error = Error{ErrorKind::kValidation, "No files provided"};
        return response;
    }
    std::vector<std::string> names;
    if (auto error = SanitizeAll(files, names)) {
        response.error = error;
        return response;
    }
    std::vector<std::string> test_files;
    for (const auto& name : names) {
        if (IsTestFile(name)) {
            test_files.push_back(name);
        }
    }
    if (test_files.empty()) {
        response.error = Error{ErrorKind::kValidation, TestNamingHint()};
        return response;
    }

    response.session_id = utils::GenerateUuid();
    const auto command = BuildTestCommand(test_files);
    RunOutput out{};
    runtime::SandboxHandle sandbox;
    std::optional<Error> error;
    if (auto pooled = pool_.Acquire()) {
        pool_.ReplenishAsync();
        sandbox = *pooled;
        error = RunTestsPooled(sandbox, files, command, out);
    } else {
        error = RunTestsFresh(files, command, sandbox, out);
    }
    if (error) {
        utils::Log(utils::LogLevel::kError, "dispatch",
                   std::string("test run failed: ") + ToString(error->kind) + ": " + error->message);
        response.error = error;
        response.result.status = "failure";
        response.result.exit_code = -1;
        return response;
    }

    response.result.exit_code = out.exit_code;
    response.result.status = ClassifyExitCode(out.exit_code);
    response.result.summary = ParseTestReport(out.output);
    response.result.raw_output = std::move(out.output);

    session::Session session{};
    session.id = response.session_id;
    session.sandbox = sandbox;
    session.mode = session::SessionMode::kTest;
    session.state = session::SessionState::kCompleted;
    session.sandbox_released = true;
    session.result = response.result;
    registry_.Create(std::move(session));
    utils::Log(utils::LogLevel::kInfo, "dispatch",
               "test session=" + response.session_id + " status=" + response.result.status +
               " exit=" + std::to_string(response.result.exit_code));
    return response;
}

std::optional<Error> ExecutionDispatcher::RunTestsPooled(const runtime::SandboxHandle& sandbox,
                                                         const std::vector<sandbox::SourceFile>& files,
                                                         const std::string& command,
                                                         RunOutput& out) {
    SandboxLease lease(runtime_, sandbox);
    try {
        const auto bundle = stager_.Stage(files);
        if (auto error = stager_.Inject(bundle, sandbox)) {
            return error;
        }
        const auto install = runtime_.Exec(
            sandbox, {"sh", "-c", config_.execution.test_install_command}, stager_.WorkDir(), false);
        if (install.exit_code != 0) {
            utils::Log(utils::LogLevel::kWarn, "dispatch",
                       "test runner install exited with " + std::to_string(install.exit_code));
        }
        const auto run = runtime_.Exec(sandbox, {"sh", "-c", command}, stager_.WorkDir(), false);
        out.exit_code = run.exit_code;
        out.output = run.output;
    } catch (const sandbox::StagingError& ex) {
        return Error{ErrorKind::kStaging, ex.what()};
    } catch (const runtime::RuntimeError& ex) {
        return Error{ErrorKind::kDispatch, ex.what()};
    }
    return std::nullopt;
}

std::optional<Error> ExecutionDispatcher::RunTestsFresh(const std::vector<sandbox::SourceFile>& files,
                                                        const std::string& command,
                                                        runtime::SandboxHandle& sandbox,
                                                        RunOutput& out) {
    std::shared_ptr<sandbox::StagingArea> staging;
    try {
        staging = stager_.Materialize(files);
    } catch (const sandbox::StagingError& ex) {
        return Error{ErrorKind::kStaging, ex.what()};
    }
    try {
        sandbox = runtime_.Create(FreshOptions(
            {"sh", "-c", config_.execution.test_install_command + "; " + command}, *staging));
    } catch (const runtime::RuntimeError& ex) {
        return Error{ErrorKind::kRuntimeCreation, ex.what()};
    }
    SandboxLease lease(runtime_, sandbox);
    try {
        out.exit_code = runtime_.Wait(sandbox);
        out.output = runtime_.Logs(sandbox);
    } catch (const runtime::RuntimeError& ex) {
        return Error{ErrorKind::kDispatch, ex.what()};
    }
    return std::nullopt;
}

PollResult ExecutionDispatcher::Poll(const std::string& session_id) {
    PollResult result{};
    const auto session = registry_.Get(session_id);
    if (!session) {
        result.error = Error{ErrorKind::kNotFound, "Session not found"};
        return result;
    }
    if (session->result) {
        result.logs = session->result->raw_output;
        return result;
    }
    try {
        const auto state = runtime_.Status(session->sandbox);
        // Only a sandbox whose main process has ended has complete logs.
        if (state != runtime::SandboxState::kExited && state != runtime::SandboxState::kDead) {
            result.running = true;
            return result;
        }
        result.logs = runtime_.Logs(session->sandbox);
    } catch (const runtime::RuntimeError& ex) {
        utils::Log(utils::LogLevel::kError, "dispatch", std::string("error while retrieving logs: ") + ex.what());
        result.error = Error{ErrorKind::kDispatch, ex.what()};
        return result;
    }
    if (session->state != session::SessionState::kCompleted && registry_.MarkCompleted(session_id)) {
        utils::Log(utils::LogLevel::kInfo, "session", session_id + " completed");
    }
    return result;
}

CleanupResult ExecutionDispatcher::Cleanup(const std::string& session_id) {
    CleanupResult result{};
    const auto session = registry_.Delete(session_id);
    if (!session) {
        result.error = Error{ErrorKind::kNotFound, "Session not found"};
        return result;
    }
    if (!session->sandbox_released) {
        if (auto error = ReleaseSandbox(runtime_, session->sandbox)) {
            result.error = error;
            return result;
        }
    }
    utils::Log(utils::LogLevel::kInfo, "session", session_id + " explicitly_cleaned");
    result.status = "cleaned up";
    return result;
}

sandbox::PrewarmResult ExecutionDispatcher::Prewarm() {
    return pool_.Prewarm();
}

}  // namespace runbox::executor
