#include "runner/python_strategy.hpp"

#include <iostream>

#include "runner/output_matcher.hpp"
#include "utils/logging.hpp"

namespace ojrunner::runner {

PythonStrategy::PythonStrategy(toolchain::ToolchainResolver resolver,
                               process::ProcessRunner process_runner)
    : resolver_(std::move(resolver)),
      process_runner_(std::move(process_runner)) {}

ExecutionOutcome PythonStrategy::Execute(const SampleTestRequest& request) const {
    const auto interpreter = resolver_.Resolve(toolchain::ToolRole::kInterpreter);
    if (utils::LogEnabled(utils::LogLevel::kInfo)) {
        std::cerr << "[python] " << interpreter << " " << request.source_file_path.string() << std::endl;
    }

    const auto result = process_runner_.Run(
        interpreter,
        {request.source_file_path.string()},
        request.sample_input,
        request.source_file_path.parent_path().string());

    ExecutionOutcome outcome{};
    outcome.std_out = result.output;
    outcome.std_err = result.error;
    outcome.exit_code = result.exit_code;
    outcome.timed_out = result.timed_out;
    outcome.matched = MatchOutput(result.output, request.expected_output);
    return outcome;
}

}  // namespace ojrunner::runner
