#pragma once

#include <string>

#include "process/process_runner.hpp"
#include "runner/language_strategy.hpp"
#include "toolchain/toolchain_resolver.hpp"

namespace ojrunner::runner {

// Compiles into a temporary workspace, then runs the detected public class.
class JavaStrategy : public LanguageStrategy {
public:
    JavaStrategy(toolchain::ToolchainResolver resolver, process::ProcessRunner process_runner);

    std::string Name() const override { return "java"; }
    std::string Description() const override { return "Compile with javac, then run the public class with java."; }
    ExecutionOutcome Execute(const SampleTestRequest& request) const override;

    static constexpr const char* kWorkspacePrefix = "ojrunner-java-";

private:
    toolchain::ToolchainResolver resolver_;
    process::ProcessRunner process_runner_;
};

}  // namespace ojrunner::runner
