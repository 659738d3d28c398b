#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace ojrunner::config {
namespace {

std::string GetEnv(const toolchain::EnvLookup& env, const char* name) {
    if (!env) {
        return {};
    }
    const auto value = env(name);
    return value ? *value : std::string();
}

std::string GetEnvFallback(const toolchain::EnvLookup& env, const char* primary, const char* secondary) {
    auto value = GetEnv(env, primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(env, secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    std::istringstream stream(value);
    int parsed = 0;
    if (!(stream >> parsed)) {
        return fallback;
    }
    return parsed;
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("toolchain") && data["toolchain"].is_object()) {
        const auto& toolchain = data["toolchain"];
        if (toolchain.contains("pythonPath") && toolchain["pythonPath"].is_string()) {
            config.toolchain.interpreter_path_override = toolchain["pythonPath"].get<std::string>();
        }
        if (toolchain.contains("javaPath") && toolchain["javaPath"].is_string()) {
            config.toolchain.runtime_path_override = toolchain["javaPath"].get<std::string>();
        }
        if (toolchain.contains("javacPath") && toolchain["javacPath"].is_string()) {
            config.toolchain.compiler_path_override = toolchain["javacPath"].get<std::string>();
        }
        if (toolchain.contains("installRootVariables") && toolchain["installRootVariables"].is_array()) {
            config.toolchain.install_root_candidates.clear();
            for (const auto& item : toolchain["installRootVariables"]) {
                if (item.is_string()) {
                    config.toolchain.install_root_candidates.push_back(item.get<std::string>());
                }
            }
        }
    }

    if (data.contains("runner") && data["runner"].is_object()) {
        const auto& runner = data["runner"];
        if (runner.contains("timeoutMs") && runner["timeoutMs"].is_number_integer()) {
            config.runner.timeout_ms = runner["timeoutMs"].get<int>();
        }
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            config.log.min_level = utils::ParseLogLevel(log["level"].get<std::string>(), config.log.min_level);
        }
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto explicit_path = utils::GetEnv("OJRUNNER_CONFIG");
    if (explicit_path && !explicit_path->empty()) {
        return std::filesystem::path(*explicit_path);
    }
    return GetHomePath() / ".ojrunner" / "config.json";
}

Config LoadConfig(const std::filesystem::path& path, const toolchain::EnvLookup& env) {
    Config config{};

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        if (!input.is_open()) {
            std::cerr << "[config] cannot open " << path.string() << ", using defaults" << std::endl;
        } else {
            try {
                nlohmann::json data;
                input >> data;
                ApplyConfigFromJson(config, data);
            } catch (const nlohmann::json::exception& ex) {
                std::cerr << "[config] ignoring malformed " << path.string() << ": " << ex.what() << std::endl;
            }
        }
    }

    const auto python_path = GetEnvFallback(env,
        "OJRUNNER_TOOLCHAIN__PYTHON_PATH",
        "OJRUNNER_PYTHON_PATH");
    if (!python_path.empty()) {
        config.toolchain.interpreter_path_override = python_path;
    }

    const auto java_path = GetEnvFallback(env,
        "OJRUNNER_TOOLCHAIN__JAVA_PATH",
        "OJRUNNER_JAVA_PATH");
    if (!java_path.empty()) {
        config.toolchain.runtime_path_override = java_path;
    }

    const auto javac_path = GetEnvFallback(env,
        "OJRUNNER_TOOLCHAIN__JAVAC_PATH",
        "OJRUNNER_JAVAC_PATH");
    if (!javac_path.empty()) {
        config.toolchain.compiler_path_override = javac_path;
    }

    const auto install_roots = GetEnvFallback(env,
        "OJRUNNER_TOOLCHAIN__INSTALL_ROOT_VARIABLES",
        "OJRUNNER_INSTALL_ROOT_VARIABLES");
    if (!install_roots.empty()) {
        config.toolchain.install_root_candidates = SplitCsv(install_roots);
    }

    const auto timeout_ms = GetEnvFallback(env,
        "OJRUNNER_RUNNER__TIMEOUT_MS",
        "OJRUNNER_TIMEOUT_MS");
    if (!timeout_ms.empty()) {
        config.runner.timeout_ms = ParseInt(timeout_ms, config.runner.timeout_ms);
    }
    if (config.runner.timeout_ms < 0) {
        config.runner.timeout_ms = 0;
    }

    const auto log_level = GetEnvFallback(env,
        "OJRUNNER_LOG__LEVEL",
        "OJRUNNER_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.min_level = utils::ParseLogLevel(log_level, config.log.min_level);
    }

    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

}  // namespace ojrunner::config
