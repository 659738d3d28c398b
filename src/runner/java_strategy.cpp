#include "runner/java_strategy.hpp"

#include <iostream>

#include "runner/entry_point.hpp"
#include "runner/errors.hpp"
#include "runner/output_matcher.hpp"
#include "runner/workspace.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace ojrunner::runner {
namespace {

const char* kUnknownCompileError = "unknown compile error";

std::string CompileDiagnostics(const process::ProcessResult& result) {
    if (!utils::Trim(result.error).empty()) {
        return result.error;
    }
    if (!utils::Trim(result.output).empty()) {
        return result.output;
    }
    return kUnknownCompileError;
}

}  // namespace

JavaStrategy::JavaStrategy(toolchain::ToolchainResolver resolver,
                           process::ProcessRunner process_runner)
    : resolver_(std::move(resolver)),
      process_runner_(std::move(process_runner)) {}

ExecutionOutcome JavaStrategy::Execute(const SampleTestRequest& request) const {
    const auto entry = DetectEntryPointInFile(request.source_file_path);
    const auto javac = resolver_.Resolve(toolchain::ToolRole::kCompiler);
    const auto java = resolver_.Resolve(toolchain::ToolRole::kRuntime);
    const auto source = request.source_file_path.string();
    const auto source_dir = request.source_file_path.parent_path().string();

    ScopedWorkspace workspace(kWorkspacePrefix);
    const auto classes_dir = workspace.Path().string();

    if (utils::LogEnabled(utils::LogLevel::kInfo)) {
        std::cerr << "[java] compile " << source << " with " << javac << std::endl;
    }
    const auto compile_result = process_runner_.Run(
        javac,
        {"-encoding", "UTF-8", "-d", classes_dir, source},
        "",
        source_dir);
    if (compile_result.exit_code != 0) {
        if (utils::LogEnabled(utils::LogLevel::kInfo)) {
            std::cerr << "[java] compile failed exit="
                      << (compile_result.exit_code ? std::to_string(*compile_result.exit_code) : std::string("(none)"))
                      << std::endl;
        }
        throw CompileError(CompileDiagnostics(compile_result));
    }

    const auto class_name = entry.QualifiedName();
    if (utils::LogEnabled(utils::LogLevel::kInfo)) {
        std::cerr << "[java] run " << class_name << " with " << java << std::endl;
    }
    const auto run_result = process_runner_.Run(
        java,
        {"-cp", classes_dir, class_name},
        request.sample_input,
        source_dir);

    ExecutionOutcome outcome{};
    outcome.std_out = run_result.output;
    outcome.std_err = run_result.error;
    outcome.exit_code = run_result.exit_code;
    outcome.timed_out = run_result.timed_out;
    outcome.matched = MatchOutput(run_result.output, request.expected_output);
    return outcome;
}

}  // namespace ojrunner::runner
