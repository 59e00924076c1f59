#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "executor/execution_dispatcher.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "runtime/docker_runtime.hpp"
#include "sandbox/code_stager.hpp"
#include "sandbox/warm_pool.hpp"
#include "server/http_routes.hpp"
#include "session/session_registry.hpp"
#include "sweeper/expiration_sweeper.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}

// Runtime, pool, registry and dispatcher wired from one configuration.
struct Services {
    explicit Services(const runbox::config::Config& loaded)
        : config(loaded)
        , runtime(config.runtime)
        , pool(runtime,
               runbox::executor::IdleSandboxOptions(config),
               static_cast<std::size_t>(config.pool.size))
        , stager(runtime, config.runtime.work_dir, config.session.staging_root)
        , dispatcher(config, runtime, pool, stager, registry) {}

    runbox::config::Config config;
    runbox::runtime::DockerRuntime runtime;
    runbox::sandbox::WarmPool pool;
    runbox::sandbox::CodeStager stager;
    runbox::session::SessionRegistry registry;
    runbox::executor::ExecutionDispatcher dispatcher;
};

runbox::config::Config LoadAndApplyConfig() {
    auto config = runbox::config::LoadConfig();
    runbox::utils::LogConfig log_config{};
    log_config.min_level = runbox::utils::ParseLogLevel(config.logging.level);
    runbox::utils::SetLogConfig(log_config);
    return config;
}

int RunServer() {
    Services services(LoadAndApplyConfig());
    const auto& config = services.config;

    runbox::sweeper::ExpirationSweeper sweeper(
        services.registry,
        services.runtime,
        services.pool,
        std::chrono::seconds(config.session.sweep_interval_s),
        std::chrono::seconds(config.session.timeout_s));

    httplib::Server http_server;
    runbox::server::RegisterRoutes(http_server, services.dispatcher, services.registry, services.pool);

    InstallSignalHandlers();

    if (config.pool.prewarm_on_start) {
        services.pool.ReplenishAsync();
    }
    sweeper.Start();

    const std::string host = config.server.host;
    const int port = config.server.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        const bool ok = http_server.listen(host, port);
        if (!ok) {
            listen_failed = true;
            runbox::utils::Log(runbox::utils::LogLevel::kError, "http",
                               "server failed to listen on " + host + ":" + std::to_string(port));
        }
    });

    std::cout << "runbox listening on " << host << ":" << port << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    runbox::utils::Log(runbox::utils::LogLevel::kInfo, "shutdown", "stopping");
    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    sweeper.Stop();
    services.pool.Drain();
    return listen_failed.load() ? 1 : 0;
}

int RunOnce(const std::vector<std::string>& paths) {
    std::vector<runbox::sandbox::SourceFile> files;
    for (const auto& path : paths) {
        std::ifstream input(path, std::ios::binary);
        if (!input.is_open()) {
            std::cout << "Failed to open " << path << std::endl;
            return 1;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        files.push_back(runbox::sandbox::SourceFile{path, buffer.str()});
    }

    Services services(LoadAndApplyConfig());
    InstallSignalHandlers();
    auto& dispatcher = services.dispatcher;

    bool is_test_run = files.size() > 1;
    for (const auto& file : files) {
        const auto name = runbox::sandbox::CodeStager::SanitizeName(file.name);
        if (name && dispatcher.IsTestFile(*name)) {
            is_test_run = true;
        }
    }

    nlohmann::json output = nlohmann::json::object();
    int exit_code = 0;
    if (is_test_run) {
        const auto response = dispatcher.SubmitTests(files);
        if (response.error) {
            output["error"] = response.error->message;
            exit_code = 1;
        } else {
            output["status"] = response.result.status;
            output["exit_code"] = response.result.exit_code;
            output["raw_output"] = response.result.raw_output;
            output["session_id"] = response.session_id;
            exit_code = response.result.exit_code == 0 ? 0 : 1;
        }
    } else {
        const auto submitted = dispatcher.SubmitScript(files);
        if (submitted.error) {
            output["error"] = submitted.error->message;
            exit_code = 1;
        } else {
            output["session_id"] = submitted.session_id;
            while (g_signal == 0) {
                const auto polled = dispatcher.Poll(submitted.session_id);
                if (polled.error) {
                    output["error"] = polled.error->message;
                    exit_code = 1;
                    break;
                }
                if (!polled.running) {
                    output["logs"] = polled.logs;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
            }
            const auto cleaned = dispatcher.Cleanup(submitted.session_id);
            if (cleaned.error) {
                runbox::utils::Log(runbox::utils::LogLevel::kWarn, "cli", cleaned.error->message);
            }
        }
    }
    services.pool.Drain();
    std::cout << output.dump(2) << std::endl;
    return exit_code;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "serve") {
        return RunServer();
    }

    if (argc >= 3 && std::string(argv[1]) == "run") {
        return RunOnce(std::vector<std::string>(argv + 2, argv + argc));
    }

    std::cout << "Usage: runbox_cli serve | runbox_cli run <file>..." << std::endl;
    return 1;
}
