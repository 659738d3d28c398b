#pragma once

#include <string>

#include "process/process_runner.hpp"
#include "runner/language_strategy.hpp"
#include "toolchain/toolchain_resolver.hpp"

namespace ojrunner::runner {

class PythonStrategy : public LanguageStrategy {
public:
    PythonStrategy(toolchain::ToolchainResolver resolver, process::ProcessRunner process_runner);

    std::string Name() const override { return "python"; }
    std::string Description() const override { return "Run the source with the Python interpreter."; }
    ExecutionOutcome Execute(const SampleTestRequest& request) const override;

private:
    toolchain::ToolchainResolver resolver_;
    process::ProcessRunner process_runner_;
};

}  // namespace ojrunner::runner
