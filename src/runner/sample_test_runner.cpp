#include "runner/sample_test_runner.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

#include "process/process_runner.hpp"
#include "runner/errors.hpp"
#include "runner/java_strategy.hpp"
#include "runner/python_strategy.hpp"
#include "toolchain/toolchain_resolver.hpp"
#include "utils/logging.hpp"

namespace ojrunner::runner {
namespace {

std::filesystem::path ValidateSourcePath(const std::filesystem::path& path) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        throw ValidationError("cannot resolve source file path " + path.string() + ": " + ec.message());
    }
    if (!std::filesystem::exists(absolute, ec)) {
        throw ValidationError("source file does not exist: " + absolute.string());
    }
    if (!std::filesystem::is_regular_file(absolute, ec)) {
        throw ValidationError("source path is not a regular file: " + absolute.string());
    }
    std::ifstream probe(absolute, std::ios::binary);
    if (!probe.is_open()) {
        throw ValidationError("source file is not readable: " + absolute.string());
    }
    return absolute.lexically_normal();
}

}  // namespace

void SampleTestRunner::Register(std::unique_ptr<LanguageStrategy> strategy) {
    auto name = strategy->Name();
    strategies_[std::move(name)] = std::move(strategy);
}

bool SampleTestRunner::Has(const std::string& language) const {
    return strategies_.find(language) != strategies_.end();
}

std::vector<std::string> SampleTestRunner::Languages() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : strategies_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

ExecutionOutcome SampleTestRunner::RunSampleTest(const SampleTestRequest& request) const {
    if (request.source_file_path.empty()) {
        throw ValidationError("source file path is empty");
    }
    if (request.sample_input.empty()) {
        throw ValidationError("sample input is empty");
    }
    SampleTestRequest validated = request;
    validated.source_file_path = ValidateSourcePath(request.source_file_path);

    auto it = strategies_.find(request.language);
    if (it == strategies_.end()) {
        throw UnsupportedLanguageError(request.language);
    }

    if (utils::LogEnabled(utils::LogLevel::kInfo)) {
        std::cerr << "[runner] start language=" << request.language
                  << " file=" << validated.source_file_path.string()
                  << " expected=" << (request.expected_output ? "yes" : "no") << std::endl;
    }
    auto outcome = it->second->Execute(validated);
    if (utils::LogEnabled(utils::LogLevel::kInfo)) {
        std::cerr << "[runner] end language=" << request.language
                  << " exit="
                  << (outcome.exit_code ? std::to_string(*outcome.exit_code) : std::string("(none)"))
                  << " matched="
                  << (outcome.matched ? (*outcome.matched ? "true" : "false") : "(none)")
                  << std::endl;
    }
    return outcome;
}

SampleTestRunner CreateDefaultRunner(const config::Config& config) {
    const toolchain::ToolchainResolver resolver(config.toolchain);
    const process::ProcessRunner process_runner(std::chrono::milliseconds(config.runner.timeout_ms));

    SampleTestRunner runner;
    runner.Register(std::make_unique<PythonStrategy>(resolver, process_runner));
    runner.Register(std::make_unique<JavaStrategy>(resolver, process_runner));
    return runner;
}

}  // namespace ojrunner::runner
