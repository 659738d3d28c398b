#include "toolchain/toolchain_resolver.hpp"

#include <filesystem>

#include "utils/common.hpp"

namespace ojrunner::toolchain {
namespace {

const char* kCompilerTool = "javac";
const char* kRuntimeTool = "java";
const char* kInterpreterTool = "python";

std::string PickFirst(const std::vector<std::string>& candidates) {
    for (const auto& candidate : candidates) {
        if (!utils::Trim(candidate).empty()) {
            return candidate;
        }
    }
    return {};
}

}  // namespace

const char* ToString(ToolRole role) {
    switch (role) {
        case ToolRole::kCompiler: return "compiler";
        case ToolRole::kRuntime: return "runtime";
        case ToolRole::kInterpreter: return "interpreter";
    }
    return "unknown";
}

EnvLookup ProcessEnvLookup() {
    return [](const std::string& name) { return utils::GetEnv(name); };
}

ToolchainResolver::ToolchainResolver(ToolchainConfig config,
                                     EnvLookup env,
                                     std::string executable_suffix)
    : config_(std::move(config)),
      env_(std::move(env)),
      suffix_(std::move(executable_suffix)) {}

std::string ToolchainResolver::DefaultExecutableSuffix() {
#if defined(_WIN32)
    return ".exe";
#else
    return "";
#endif
}

std::string ToolchainResolver::Resolve(ToolRole role) const {
    switch (role) {
        case ToolRole::kCompiler:
            return ResolveJdkTool(config_.compiler_path_override, kCompilerTool);
        case ToolRole::kRuntime:
            return ResolveJdkTool(config_.runtime_path_override, kRuntimeTool);
        case ToolRole::kInterpreter: {
            const auto configured = utils::Trim(config_.interpreter_path_override);
            return configured.empty() ? std::string(kInterpreterTool) : configured;
        }
    }
    return {};
}

std::string ToolchainResolver::ResolveJdkTool(const std::string& override_path,
                                              const std::string& tool) const {
    std::vector<std::string> candidates;
    candidates.push_back(utils::Trim(override_path));
    for (const auto& variable : config_.install_root_candidates) {
        const auto home = env_ ? env_(variable) : std::nullopt;
        if (!home || utils::Trim(*home).empty()) {
            continue;
        }
        candidates.push_back((std::filesystem::path(*home) / "bin" / (tool + suffix_)).string());
    }
    if (!suffix_.empty()) {
        candidates.push_back(tool + suffix_);
    }
    candidates.push_back(tool);

    const auto picked = PickFirst(candidates);
    return picked.empty() ? tool : picked;
}

}  // namespace ojrunner::toolchain
