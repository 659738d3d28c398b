#include "cli/run_command.hpp"

#include <fstream>
#include <sstream>

#include "runner/sample_test_runner.hpp"

namespace ojrunner::cli {

namespace {

std::string ReadTextFile(const std::string& path, const char* what) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw runner::ValidationError(std::string("cannot read ") + what + " file: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

nlohmann::json OptionalJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

void PrintOutcome(const runner::ExecutionOutcome& outcome, std::ostream& out) {
    out << "exit code: "
        << (outcome.exit_code ? std::to_string(*outcome.exit_code) : std::string("(none)"));
    if (outcome.timed_out) {
        out << " (timed out)";
    }
    out << std::endl;
    if (!outcome.matched) {
        out << "verdict: no expected output" << std::endl;
    } else {
        out << "verdict: " << (*outcome.matched ? "matched" : "mismatch") << std::endl;
    }
    out << "[stdout]\n" << outcome.std_out;
    if (!outcome.std_out.empty() && outcome.std_out.back() != '\n') {
        out << '\n';
    }
    if (!outcome.std_err.empty()) {
        out << "[stderr]\n" << outcome.std_err;
        if (outcome.std_err.back() != '\n') {
            out << '\n';
        }
    }
    out << std::flush;
}

void ReportFailure(const RunArguments& args,
                   const std::string& kind,
                   const std::string& message,
                   std::ostream& out,
                   std::ostream& err) {
    if (args.json) {
        out << DumpJson(BuildFailureJson(args, kind, message)) << std::endl;
    } else {
        err << "error (" << kind << "): " << message << std::endl;
    }
}

}  // namespace

void PrintUsage(std::ostream& out) {
    out << "Usage:\n"
        << "  ojrunner run --language <python|java> --file <source>\n"
        << "               (--input <text> | --input-file <path>)\n"
        << "               [--expected <text> | --expected-file <path>] [--json]\n"
        << "  ojrunner languages\n"
        << "  ojrunner config" << std::endl;
}

std::optional<RunArguments> ParseRunArguments(const std::vector<std::string>& args, std::ostream& err) {
    RunArguments parsed{};
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (flag == "--json") {
            parsed.json = true;
            continue;
        }
        if (i + 1 >= args.size()) {
            err << "missing value for " << flag << std::endl;
            return std::nullopt;
        }
        const std::string& value = args[++i];
        if (flag == "--language" || flag == "-l") {
            parsed.language = value;
        } else if (flag == "--file" || flag == "-f") {
            parsed.file = value;
        } else if (flag == "--input") {
            parsed.input = value;
        } else if (flag == "--input-file") {
            parsed.input_file = value;
        } else if (flag == "--expected") {
            parsed.expected = value;
        } else if (flag == "--expected-file") {
            parsed.expected_file = value;
        } else {
            err << "unknown option " << flag << std::endl;
            return std::nullopt;
        }
    }
    if (parsed.input && parsed.input_file) {
        err << "--input and --input-file are mutually exclusive" << std::endl;
        return std::nullopt;
    }
    if (parsed.expected && parsed.expected_file) {
        err << "--expected and --expected-file are mutually exclusive" << std::endl;
        return std::nullopt;
    }
    return parsed;
}

nlohmann::json BuildSuccessJson(const RunArguments& args,
                                const std::optional<std::string>& expected,
                                const runner::ExecutionOutcome& outcome) {
    return {
        {"ok", true},
        {"language", args.language},
        {"filePath", args.file},
        {"stdout", outcome.std_out},
        {"stderr", outcome.std_err},
        {"exitCode", outcome.exit_code ? nlohmann::json(*outcome.exit_code) : nlohmann::json(nullptr)},
        {"timedOut", outcome.timed_out},
        {"matched", outcome.matched ? nlohmann::json(*outcome.matched) : nlohmann::json(nullptr)},
        {"expectedOutput", OptionalJson(expected)}
    };
}

nlohmann::json BuildFailureJson(const RunArguments& args, const std::string& kind, const std::string& message) {
    return {
        {"ok", false},
        {"language", args.language},
        {"filePath", args.file},
        {"errorKind", kind},
        {"error", message}
    };
}

std::string ErrorKind(const runner::SampleTestError& error) {
    using namespace runner;
    if (dynamic_cast<const ValidationError*>(&error)) {
        return "validation";
    }
    if (dynamic_cast<const UnsupportedLanguageError*>(&error)) {
        return "unsupported_language";
    }
    if (dynamic_cast<const EntryPointError*>(&error)) {
        return "entry_point";
    }
    if (dynamic_cast<const CompileError*>(&error)) {
        return "compile";
    }
    if (dynamic_cast<const LaunchError*>(&error)) {
        return "launch";
    }
    return "error";
}

std::string DumpJson(const nlohmann::json& json) {
    return json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

int RunSample(const RunArguments& args, const config::Config& config, std::ostream& out, std::ostream& err) {
    std::optional<std::string> expected;
    try {
        runner::SampleTestRequest request{};
        request.language = args.language;
        request.source_file_path = args.file;
        if (args.input_file) {
            request.sample_input = ReadTextFile(*args.input_file, "input");
        } else if (args.input) {
            request.sample_input = *args.input;
        }
        if (args.expected_file) {
            expected = ReadTextFile(*args.expected_file, "expected output");
        } else {
            expected = args.expected;
        }
        request.expected_output = expected;

        const auto sample_runner = runner::CreateDefaultRunner(config);
        const auto outcome = sample_runner.RunSampleTest(request);
        if (args.json) {
            out << DumpJson(BuildSuccessJson(args, expected, outcome)) << std::endl;
        } else {
            PrintOutcome(outcome, out);
        }
        return outcome.matched.value_or(true) ? kExitOk : kExitMismatch;
    } catch (const runner::SampleTestError& ex) {
        ReportFailure(args, ErrorKind(ex), ex.what(), out, err);
    } catch (const std::exception& ex) {
        ReportFailure(args, "system", ex.what(), out, err);
    }
    return kExitPipelineError;
}

int RunCommand(const std::vector<std::string>& args,
               const config::Config& config,
               std::ostream& out,
               std::ostream& err) {
    const auto parsed = ParseRunArguments(args, err);
    if (!parsed) {
        PrintUsage(err);
        return kExitUsage;
    }
    return RunSample(*parsed, config, out, err);
}

}  // namespace ojrunner::cli
