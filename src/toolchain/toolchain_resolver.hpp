#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ojrunner::toolchain {

enum class ToolRole {
    kCompiler,
    kRuntime,
    kInterpreter
};

const char* ToString(ToolRole role);

struct ToolchainConfig {
    std::string compiler_path_override;
    std::string runtime_path_override;
    std::string interpreter_path_override;
    // Environment variables naming an installation root with a bin/ directory.
    std::vector<std::string> install_root_candidates = {"JAVA_HOME", "JDK_HOME"};
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup ProcessEnvLookup();

class ToolchainResolver {
public:
    explicit ToolchainResolver(ToolchainConfig config,
                               EnvLookup env = ProcessEnvLookup(),
                               std::string executable_suffix = DefaultExecutableSuffix());

    // Always returns a candidate; a bad one fails later when it is launched.
    std::string Resolve(ToolRole role) const;

    const ToolchainConfig& Config() const { return config_; }

    static std::string DefaultExecutableSuffix();

private:
    std::string ResolveJdkTool(const std::string& override_path, const std::string& tool) const;

    ToolchainConfig config_;
    EnvLookup env_;
    std::string suffix_;
};

}  // namespace ojrunner::toolchain
