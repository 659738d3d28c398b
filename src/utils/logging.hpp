#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace ojrunner::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline LogConfig& GlobalLogConfig() {
    static LogConfig config{};
    return config;
}

// Call sites write tagged lines to std::cerr when this returns true.
inline bool LogEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(GlobalLogConfig().min_level);
}

}  // namespace ojrunner::utils
