#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "runner/errors.hpp"
#include "runner/sample_test_types.hpp"
#include "nlohmann/json.hpp"

namespace ojrunner::cli {

constexpr int kExitOk = 0;
constexpr int kExitMismatch = 1;
constexpr int kExitPipelineError = 2;
constexpr int kExitUsage = 64;

struct RunArguments {
    std::string language;
    std::string file;
    std::optional<std::string> input;
    std::optional<std::string> input_file;
    std::optional<std::string> expected;
    std::optional<std::string> expected_file;
    bool json = false;
};

void PrintUsage(std::ostream& out);

// `args` are the words after "run". Problems are reported on `err`.
std::optional<RunArguments> ParseRunArguments(const std::vector<std::string>& args, std::ostream& err);

nlohmann::json BuildSuccessJson(const RunArguments& args,
                                const std::optional<std::string>& expected,
                                const runner::ExecutionOutcome& outcome);
nlohmann::json BuildFailureJson(const RunArguments& args, const std::string& kind, const std::string& message);
std::string ErrorKind(const runner::SampleTestError& error);

// Program output is raw bytes; invalid UTF-8 is replaced with U+FFFD.
std::string DumpJson(const nlohmann::json& json);

int RunSample(const RunArguments& args, const config::Config& config, std::ostream& out, std::ostream& err);

// Parses `args` and runs the sample; bad arguments print usage and return kExitUsage.
int RunCommand(const std::vector<std::string>& args,
               const config::Config& config,
               std::ostream& out,
               std::ostream& err);

}  // namespace ojrunner::cli
