#include "process/process_runner.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/write.hpp>
#include <boost/process.hpp>
#include <future>
#include <iostream>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>

#include "runner/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace ojrunner::process {
namespace bp = boost::process;

namespace {

constexpr std::chrono::milliseconds kExitPollInterval{10};

// A child that exits without reading its stdin turns our write into EPIPE;
// the default SIGPIPE action would take the whole process down instead.
void IgnoreSigpipe() {
    static const bool installed = [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGPIPE, &action, nullptr);
        return true;
    }();
    (void)installed;
}

boost::filesystem::path ResolveExecutable(const std::string& command) {
    if (command.find('/') != std::string::npos) {
        return boost::filesystem::path(command);
    }
    return bp::search_path(command);
}

std::string PrepareInput(const std::string& input) {
    if (input.empty() || input.back() == '\n') {
        return input;
    }
    return input + "\n";
}

std::optional<int> DecodeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return std::nullopt;
}

}  // namespace

ProcessRunner::ProcessRunner(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

ProcessResult ProcessRunner::Run(const std::string& command,
                                 const std::vector<std::string>& args,
                                 const std::string& input,
                                 const std::string& working_dir) const {
    IgnoreSigpipe();

    const auto executable = ResolveExecutable(command);
    if (executable.empty()) {
        throw runner::LaunchError("failed to start '" + command + "': executable not found on PATH");
    }

    if (utils::LogEnabled(utils::LogLevel::kDebug)) {
        std::cerr << "[process] start " << executable.string();
        if (!args.empty()) {
            std::cerr << " " << utils::Join(args, " ");
        }
        std::cerr << " cwd=" << working_dir << std::endl;
    }

    boost::asio::io_context io;
    bp::async_pipe stdin_pipe(io);
    std::future<std::string> output_future;
    std::future<std::string> error_future;

    bp::child child;
    try {
        child = bp::child(
            bp::exe = executable.string(),
            bp::args = args,
            bp::start_dir = working_dir,
            bp::std_in < stdin_pipe,
            bp::std_out > output_future,
            bp::std_err > error_future,
            io);
    } catch (const bp::process_error& ex) {
        throw runner::LaunchError("failed to start '" + command + "': " + ex.what());
    }

    const std::string payload = PrepareInput(input);
    if (payload.empty()) {
        stdin_pipe.close();
    } else {
        boost::asio::async_write(
            stdin_pipe,
            boost::asio::buffer(payload),
            [&stdin_pipe](const boost::system::error_code& ec, std::size_t) {
                if (ec && utils::LogEnabled(utils::LogLevel::kDebug)) {
                    std::cerr << "[process] stdin write stopped: " << ec.message() << std::endl;
                }
                boost::system::error_code close_ec;
                stdin_pipe.close(close_ec);
            });
    }

    ProcessResult result{};
    const auto kill_child = [&]() {
        result.timed_out = true;
        if (utils::LogEnabled(utils::LogLevel::kWarn)) {
            std::cerr << "[process] timeout after " << timeout_.count()
                      << "ms, killing pid=" << child.id() << std::endl;
        }
        ::kill(child.id(), SIGKILL);
    };

    if (timeout_ > std::chrono::milliseconds::zero()) {
        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        io.run_until(deadline);
        if (!io.stopped()) {
            kill_child();
            io.run();
        } else {
            // The pipes can close long before the child exits.
            std::error_code running_ec;
            while (child.running(running_ec)) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    kill_child();
                    break;
                }
                std::this_thread::sleep_for(kExitPollInterval);
            }
        }
    } else {
        io.run();
    }

    std::error_code wait_ec;
    child.wait(wait_ec);
    if (wait_ec) {
        throw std::system_error(wait_ec, "waiting for '" + command + "' failed");
    }

    result.output = output_future.get();
    result.error = error_future.get();
    result.exit_code = result.timed_out ? std::nullopt : DecodeExitStatus(child.native_exit_code());

    if (utils::LogEnabled(utils::LogLevel::kDebug)) {
        std::cerr << "[process] exit code "
                  << (result.exit_code ? std::to_string(*result.exit_code) : std::string("(none)"))
                  << " stdout=" << result.output.size()
                  << " stderr=" << result.error.size() << std::endl;
    }
    return result;
}

}  // namespace ojrunner::process
