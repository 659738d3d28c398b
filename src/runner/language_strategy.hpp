#pragma once

#include <string>

#include "runner/sample_test_types.hpp"

namespace ojrunner::runner {

class LanguageStrategy {
public:
    virtual ~LanguageStrategy() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // The request has already been validated by the dispatcher.
    virtual ExecutionOutcome Execute(const SampleTestRequest& request) const = 0;
};

}  // namespace ojrunner::runner
