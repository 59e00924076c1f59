#pragma once

#include <string>
#include <vector>

namespace runbox::config {

struct RuntimeConfig {
    std::string docker_binary = "docker";
    // Built from docker/sandbox.Dockerfile; any image used for test runs
    // must already contain pytest and pytest-json-report.
    std::string image = "runbox-sandbox:3.13";
    long cpu_quota = 50000;
    long cpu_period = 100000;
    std::string memory_limit = "128m";
    bool network_disabled = true;
    std::string work_dir = "/code";
    int stop_timeout_s = 2;
};

struct PoolConfig {
    int size = 1;
    bool prewarm_on_start = true;
    // PID 1 of an idle sandbox; exits cleanly on SIGTERM.
    std::vector<std::string> idle_command = {
        "sh", "-c", "trap 'exit 0' TERM; while :; do sleep 1 & wait $!; done"};
};

struct SessionConfig {
    int timeout_s = 10;
    int sweep_interval_s = 5;
    std::string staging_root = "/tmp";
};

struct ExecutionConfig {
    std::string interpreter = "python";
    std::vector<std::string> script_extensions = {".py"};
    std::vector<std::string> test_prefixes = {"test_"};
    std::vector<std::string> test_suffixes = {"_test.py"};
    std::string test_install_command =
        "python -c 'import pytest_jsonreport' 2>/dev/null || pip install --quiet pytest pytest-json-report";
    std::string test_command = "pytest";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 5000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    RuntimeConfig runtime;
    PoolConfig pool;
    SessionConfig session;
    ExecutionConfig execution;
    ServerConfig server;
    LoggingConfig logging;
};

}  // namespace runbox::config
