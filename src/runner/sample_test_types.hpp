#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ojrunner::runner {

struct SampleTestRequest {
    std::string language;
    std::filesystem::path source_file_path;
    std::string sample_input;
    std::optional<std::string> expected_output;
};

struct ExecutionOutcome {
    std::string std_out;
    std::string std_err;
    std::optional<int> exit_code;
    bool timed_out = false;
    // Absent when no expected output was supplied.
    std::optional<bool> matched;
};

}  // namespace ojrunner::runner
