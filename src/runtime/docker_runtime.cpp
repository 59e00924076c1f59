#include "runtime/docker_runtime.hpp"

#include <boost/process.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::runtime {
namespace bp = boost::process;
namespace {

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::string LastLine(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        line = utils::Trim(line);
        if (!line.empty()) {
            last = line;
        }
    }
    return last;
}

bool IsDaemonError(const std::string& output) {
    return utils::StartsWith(output, "Error response from daemon") ||
           utils::StartsWith(output, "Error: No such container");
}

}  // namespace

DockerRuntime::DockerRuntime(config::RuntimeConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> DockerRuntime::BuildCreateArgs(const CreateOptions& options) {
    std::vector<std::string> args = {
        "run",
        "-d",
        "--label", "runbox.managed=true",
        "--cpu-quota", std::to_string(options.limits.cpu_quota),
        "--cpu-period", std::to_string(options.limits.cpu_period),
        "--memory", options.limits.memory
    };
    if (options.limits.network_disabled) {
        args.insert(args.end(), {"--network", "none"});
    }
    for (const auto& mount : options.mounts) {
        auto spec = mount.host_path + ":" + mount.container_path;
        if (mount.read_only) {
            spec += ":ro";
        }
        args.insert(args.end(), {"-v", spec});
    }
    if (!options.working_dir.empty()) {
        args.insert(args.end(), {"-w", options.working_dir});
    }
    args.push_back(options.image);
    args.insert(args.end(), options.command.begin(), options.command.end());
    return args;
}

DockerRuntime::CommandResult DockerRuntime::RunDocker(const std::vector<std::string>& args,
                                                      const std::string* input,
                                                      bool merge_output) const {
    CommandResult result{};
    const std::string command = std::string("docker ") + (args.empty() ? "" : args.front());
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
    const auto discard_output = [&stdout_path, &stderr_path]() {
        std::error_code ec;
        if (!stdout_path.empty()) {
            std::filesystem::remove(stdout_path, ec);
        }
        if (!stderr_path.empty()) {
            std::filesystem::remove(stderr_path, ec);
        }
    };

    try {
        const auto stamp = utils::GenerateUuid();
        const auto temp_dir = std::filesystem::temp_directory_path();
        stdout_path = temp_dir / ("runbox_stdout_" + stamp + ".log");
        stderr_path = temp_dir / ("runbox_stderr_" + stamp + ".log");

        auto executable = config_.docker_binary;
        if (executable.find('/') == std::string::npos) {
            const auto resolved = bp::search_path(executable);
            if (resolved.empty()) {
                throw RuntimeError("docker binary not found: " + executable);
            }
            executable = resolved.string();
        }

        if (input) {
            bp::opstream stdin_stream;
            bp::child child_process(
                executable,
                bp::args(args),
                bp::std_out > stdout_path.string(),
                bp::std_err > stderr_path.string(),
                bp::std_in < stdin_stream);
            stdin_stream.write(input->data(), static_cast<std::streamsize>(input->size()));
            stdin_stream.flush();
            stdin_stream.pipe().close();
            child_process.wait();
            result.exit_code = child_process.exit_code();
        } else if (merge_output) {
            bp::child child_process(
                executable,
                bp::args(args),
                (bp::std_out & bp::std_err) > stdout_path.string(),
                bp::std_in < bp::null);
            child_process.wait();
            result.exit_code = child_process.exit_code();
        } else {
            bp::child child_process(
                executable,
                bp::args(args),
                bp::std_out > stdout_path.string(),
                bp::std_err > stderr_path.string(),
                bp::std_in < bp::null);
            child_process.wait();
            result.exit_code = child_process.exit_code();
        }
    } catch (const RuntimeError&) {
        discard_output();
        throw;
    } catch (const bp::process_error& ex) {
        discard_output();
        throw RuntimeError(command + " failed to start: " + ex.what());
    } catch (const std::exception& ex) {
        // Temp directory and RNG faults are reported as RuntimeError too.
        discard_output();
        throw RuntimeError(command + " failed: " + ex.what());
    }

    result.output = ReadFile(stdout_path);
    result.error = ReadFile(stderr_path);
    discard_output();
    utils::Log(utils::LogLevel::kDebug, "docker",
               utils::Join(args, " ") + " -> exit " + std::to_string(result.exit_code));
    return result;
}

DockerRuntime::CommandResult DockerRuntime::RunChecked(const std::vector<std::string>& args,
                                                       const std::string* input) const {
    auto result = RunDocker(args, input);
    if (result.exit_code != 0) {
        auto message = utils::Trim(result.error);
        if (message.empty()) {
            message = "exit code " + std::to_string(result.exit_code);
        }
        throw RuntimeError("docker " + args.front() + ": " + message);
    }
    return result;
}

SandboxHandle DockerRuntime::Create(const CreateOptions& options) {
    const auto result = RunChecked(BuildCreateArgs(options));
    const auto id = LastLine(result.output);
    if (id.empty()) {
        throw RuntimeError("docker run: no container id returned");
    }
    return SandboxHandle{id};
}

void DockerRuntime::InjectArchive(const SandboxHandle& sandbox,
                                  const std::string& path,
                                  const std::string& archive) {
    RunChecked({"cp", "-", sandbox.id + ":" + path}, &archive);
}

ExecOutput DockerRuntime::Exec(const SandboxHandle& sandbox,
                               const std::vector<std::string>& command,
                               const std::string& working_dir,
                               bool detached) {
    std::vector<std::string> args = {"exec"};
    if (detached) {
        args.push_back("-d");
    }
    if (!working_dir.empty()) {
        args.insert(args.end(), {"-w", working_dir});
    }
    args.push_back(sandbox.id);
    args.insert(args.end(), command.begin(), command.end());

    const auto result = RunDocker(args, nullptr, true);
    if (result.exit_code != 0 && (detached || IsDaemonError(result.output))) {
        throw RuntimeError("docker exec: " + utils::Trim(result.output));
    }
    ExecOutput output{};
    output.exit_code = result.exit_code;
    output.output = detached ? std::string() : result.output;
    return output;
}

int DockerRuntime::Wait(const SandboxHandle& sandbox) {
    const auto result = RunChecked({"wait", sandbox.id});
    try {
        return std::stoi(LastLine(result.output));
    } catch (const std::exception&) {
        throw RuntimeError("docker wait: unexpected output: " + result.output);
    }
}

SandboxState DockerRuntime::Status(const SandboxHandle& sandbox) {
    const auto result = RunChecked({"inspect", "-f", "{{.State.Status}}", sandbox.id});
    return ParseSandboxState(LastLine(result.output));
}

std::string DockerRuntime::Logs(const SandboxHandle& sandbox) {
    const auto result = RunDocker({"logs", sandbox.id}, nullptr, true);
    if (result.exit_code != 0) {
        throw RuntimeError("docker logs: " + utils::Trim(result.output));
    }
    return result.output;
}

void DockerRuntime::Stop(const SandboxHandle& sandbox) {
    RunChecked({"stop", "-t", std::to_string(config_.stop_timeout_s), sandbox.id});
}

void DockerRuntime::Remove(const SandboxHandle& sandbox) {
    RunChecked({"rm", "-f", sandbox.id});
}

}  // namespace runbox::runtime
