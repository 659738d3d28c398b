#pragma once

#include <stdexcept>
#include <string>

namespace ojrunner::runner {

// Base of every failure the sample-test pipeline reports to its caller.
class SampleTestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad request detected before any process is spawned.
class ValidationError : public SampleTestError {
public:
    using SampleTestError::SampleTestError;
};

class UnsupportedLanguageError : public SampleTestError {
public:
    explicit UnsupportedLanguageError(std::string language)
        : SampleTestError("no sample-test strategy for language '" + language + "'"),
          language_(std::move(language)) {}

    const std::string& Language() const { return language_; }

private:
    std::string language_;
};

class EntryPointError : public SampleTestError {
public:
    using SampleTestError::SampleTestError;
};

class CompileError : public SampleTestError {
public:
    explicit CompileError(const std::string& diagnostics)
        : SampleTestError(diagnostics), diagnostics_(diagnostics) {}

    const std::string& Diagnostics() const { return diagnostics_; }

private:
    std::string diagnostics_;
};

// The operating system refused to start the executable.
class LaunchError : public SampleTestError {
public:
    using SampleTestError::SampleTestError;
};

}  // namespace ojrunner::runner
