#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace runbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("RUNBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".runbox" / "config.json";
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadStringList(const nlohmann::json& source, const char* key, std::vector<std::string>& target) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

// Values that do not fit T are ignored with a warning instead of truncated.
template <typename T>
void ReadInteger(const nlohmann::json& source, const char* key, T& target) {
    if (!source.contains(key) || !source[key].is_number_integer()) {
        return;
    }
    const auto& value = source[key];
    bool in_range = false;
    if (value.is_number_unsigned()) {
        in_range = value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    } else {
        const auto signed_value = value.get<std::int64_t>();
        in_range = signed_value >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
                   signed_value <= static_cast<std::int64_t>(std::numeric_limits<T>::max());
    }
    if (!in_range) {
        utils::Log(utils::LogLevel::kWarn, "config",
                   std::string("ignoring out of range value for ") + key + ": " + value.dump());
        return;
    }
    target = value.get<T>();
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("runtime") && data["runtime"].is_object()) {
        const auto& runtime = data["runtime"];
        ReadString(runtime, "dockerBinary", config.runtime.docker_binary);
        ReadString(runtime, "image", config.runtime.image);
        ReadInteger(runtime, "cpuQuota", config.runtime.cpu_quota);
        ReadInteger(runtime, "cpuPeriod", config.runtime.cpu_period);
        ReadString(runtime, "memoryLimit", config.runtime.memory_limit);
        ReadBool(runtime, "networkDisabled", config.runtime.network_disabled);
        ReadString(runtime, "workDir", config.runtime.work_dir);
        ReadInteger(runtime, "stopTimeoutS", config.runtime.stop_timeout_s);
    }

    if (data.contains("pool") && data["pool"].is_object()) {
        const auto& pool = data["pool"];
        ReadInteger(pool, "size", config.pool.size);
        ReadBool(pool, "prewarmOnStart", config.pool.prewarm_on_start);
        ReadStringList(pool, "idleCommand", config.pool.idle_command);
    }

    if (data.contains("session") && data["session"].is_object()) {
        const auto& session = data["session"];
        ReadInteger(session, "timeoutS", config.session.timeout_s);
        ReadInteger(session, "sweepIntervalS", config.session.sweep_interval_s);
        ReadString(session, "stagingRoot", config.session.staging_root);
    }

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        ReadString(execution, "interpreter", config.execution.interpreter);
        ReadStringList(execution, "scriptExtensions", config.execution.script_extensions);
        ReadStringList(execution, "testPrefixes", config.execution.test_prefixes);
        ReadStringList(execution, "testSuffixes", config.execution.test_suffixes);
        ReadString(execution, "testInstallCommand", config.execution.test_install_command);
        ReadString(execution, "testCommand", config.execution.test_command);
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInteger(server, "port", config.server.port);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

long ParseLong(const std::string& value, long fallback) {
    try {
        return std::stol(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyEnvOverrides(Config& config) {
    const auto docker_binary = GetEnvFallback(
        "RUNBOX_RUNTIME__DOCKER_BINARY",
        "RUNBOX_RUNTIME_DOCKER_BINARY");
    if (!docker_binary.empty()) {
        config.runtime.docker_binary = docker_binary;
    }

    const auto image = GetEnvFallback("RUNBOX_RUNTIME__IMAGE", "RUNBOX_RUNTIME_IMAGE");
    if (!image.empty()) {
        config.runtime.image = image;
    }

    const auto cpu_quota = GetEnvFallback("RUNBOX_RUNTIME__CPU_QUOTA", "RUNBOX_RUNTIME_CPU_QUOTA");
    if (!cpu_quota.empty()) {
        config.runtime.cpu_quota = ParseLong(cpu_quota, config.runtime.cpu_quota);
    }

    const auto cpu_period = GetEnvFallback("RUNBOX_RUNTIME__CPU_PERIOD", "RUNBOX_RUNTIME_CPU_PERIOD");
    if (!cpu_period.empty()) {
        config.runtime.cpu_period = ParseLong(cpu_period, config.runtime.cpu_period);
    }

    const auto memory_limit = GetEnvFallback(
        "RUNBOX_RUNTIME__MEMORY_LIMIT",
        "RUNBOX_RUNTIME_MEMORY_LIMIT");
    if (!memory_limit.empty()) {
        config.runtime.memory_limit = memory_limit;
    }

    const auto network_disabled = GetEnvFallback(
        "RUNBOX_RUNTIME__NETWORK_DISABLED",
        "RUNBOX_RUNTIME_NETWORK_DISABLED");
    if (!network_disabled.empty()) {
        config.runtime.network_disabled = ParseBool(network_disabled);
    }

    const auto pool_size = GetEnvFallback("RUNBOX_POOL__SIZE", "RUNBOX_POOL_SIZE");
    if (!pool_size.empty()) {
        config.pool.size = ParseInt(pool_size, config.pool.size);
    }

    const auto prewarm_on_start = GetEnvFallback(
        "RUNBOX_POOL__PREWARM_ON_START",
        "RUNBOX_POOL_PREWARM_ON_START");
    if (!prewarm_on_start.empty()) {
        config.pool.prewarm_on_start = ParseBool(prewarm_on_start);
    }

    const auto timeout = GetEnvFallback("RUNBOX_SESSION__TIMEOUT_S", "RUNBOX_SESSION_TIMEOUT_S");
    if (!timeout.empty()) {
        config.session.timeout_s = ParseInt(timeout, config.session.timeout_s);
    }

    const auto sweep_interval = GetEnvFallback(
        "RUNBOX_SESSION__SWEEP_INTERVAL_S",
        "RUNBOX_SESSION_SWEEP_INTERVAL_S");
    if (!sweep_interval.empty()) {
        config.session.sweep_interval_s = ParseInt(sweep_interval, config.session.sweep_interval_s);
    }

    const auto staging_root = GetEnvFallback(
        "RUNBOX_SESSION__STAGING_ROOT",
        "RUNBOX_SESSION_STAGING_ROOT");
    if (!staging_root.empty()) {
        config.session.staging_root = staging_root;
    }

    const auto script_extensions = GetEnvFallback(
        "RUNBOX_EXECUTION__SCRIPT_EXTENSIONS",
        "RUNBOX_EXECUTION_SCRIPT_EXTENSIONS");
    if (!script_extensions.empty()) {
        config.execution.script_extensions = SplitCsv(script_extensions);
    }

    const auto host = GetEnvFallback("RUNBOX_SERVER__HOST", "RUNBOX_SERVER_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("RUNBOX_SERVER__PORT", "RUNBOX_SERVER_PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto log_level = GetEnvFallback("RUNBOX_LOGGING__LEVEL", "RUNBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

void Normalize(Config& config) {
    config.pool.size = std::max(config.pool.size, 0);
    config.session.timeout_s = std::max(config.session.timeout_s, 1);
    config.session.sweep_interval_s = std::max(config.session.sweep_interval_s, 1);
    if (config.server.port < 0 || config.server.port > 65535) {
        utils::Log(utils::LogLevel::kWarn, "config",
                   "invalid server port " + std::to_string(config.server.port) + ", using 5000");
        config.server.port = 5000;
    }
}

}  // namespace

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            // Keep defaults on parse errors
            utils::Log(utils::LogLevel::kWarn, "config", "failed to parse " + path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);
    Normalize(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace runbox::config
