#pragma once

#include <chrono>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

namespace runbox::utils {

using Clock = std::function<std::chrono::steady_clock::time_point()>;

inline Clock SteadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

inline bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Wraps value in single quotes for /bin/sh.
std::string ShellQuote(const std::string& value);

std::string Trim(std::string value);

// RFC 4122 version 4 identifier, e.g. "3f0c9c1e-7d0a-4b7e-9a55-0e6c2b1f4d2a".
std::string GenerateUuid();

}  // namespace runbox::utils
