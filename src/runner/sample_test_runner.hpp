#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "runner/language_strategy.hpp"
#include "runner/sample_test_types.hpp"

namespace ojrunner::runner {

class SampleTestRunner {
public:
    void Register(std::unique_ptr<LanguageStrategy> strategy);
    bool Has(const std::string& language) const;
    std::vector<std::string> Languages() const;

    // Validation failures throw before any process is spawned.
    ExecutionOutcome RunSampleTest(const SampleTestRequest& request) const;

private:
    std::unordered_map<std::string, std::unique_ptr<LanguageStrategy>> strategies_;
};

// Runner with the python and java strategies wired to `config`.
SampleTestRunner CreateDefaultRunner(const config::Config& config);

}  // namespace ojrunner::runner
