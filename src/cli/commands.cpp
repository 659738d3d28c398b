#include <iostream>
#include <string>
#include <vector>

#include "cli/run_command.hpp"
#include "config/config_loader.hpp"
#include "runner/sample_test_runner.hpp"
#include "toolchain/toolchain_resolver.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

using ojrunner::cli::kExitOk;
using ojrunner::cli::kExitUsage;

int ListLanguages(const ojrunner::config::Config& config) {
    const auto runner = ojrunner::runner::CreateDefaultRunner(config);
    for (const auto& language : runner.Languages()) {
        std::cout << language << std::endl;
    }
    return kExitOk;
}

int ShowConfig(const ojrunner::config::Config& config) {
    const ojrunner::toolchain::ToolchainResolver resolver(config.toolchain);
    nlohmann::json json = {
        {"configPath", ojrunner::config::DefaultConfigPath().string()},
        {"toolchain", {
            {"pythonPath", config.toolchain.interpreter_path_override},
            {"javaPath", config.toolchain.runtime_path_override},
            {"javacPath", config.toolchain.compiler_path_override},
            {"installRootVariables", config.toolchain.install_root_candidates}
        }},
        {"resolved", {
            {"interpreter", resolver.Resolve(ojrunner::toolchain::ToolRole::kInterpreter)},
            {"compiler", resolver.Resolve(ojrunner::toolchain::ToolRole::kCompiler)},
            {"runtime", resolver.Resolve(ojrunner::toolchain::ToolRole::kRuntime)}
        }},
        {"runner", {{"timeoutMs", config.runner.timeout_ms}}},
        {"log", {{"level", ojrunner::utils::ToString(config.log.min_level)}}}
    };
    std::cout << ojrunner::cli::DumpJson(json) << std::endl;
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        ojrunner::cli::PrintUsage(std::cout);
        return kExitUsage;
    }

    const auto config = ojrunner::config::LoadConfig();
    ojrunner::utils::GlobalLogConfig() = config.log;

    const std::string command = argv[1];
    if (command == "run") {
        const std::vector<std::string> words(argv + 2, argv + argc);
        return ojrunner::cli::RunCommand(words, config, std::cout, std::cerr);
    }
    if (command == "languages") {
        return ListLanguages(config);
    }
    if (command == "config") {
        return ShowConfig(config);
    }
    if (command == "help" || command == "--help" || command == "-h") {
        ojrunner::cli::PrintUsage(std::cout);
        return kExitOk;
    }

    std::cerr << "unknown command " << command << std::endl;
    ojrunner::cli::PrintUsage(std::cout);
    return kExitUsage;
}
