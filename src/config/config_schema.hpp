#pragma once

#include <string>

#include "toolchain/toolchain_resolver.hpp"
#include "utils/logging.hpp"

namespace ojrunner::config {

struct RunnerConfig {
    // 0 disables the wall-clock limit.
    int timeout_ms = 0;
};

struct Config {
    toolchain::ToolchainConfig toolchain;
    RunnerConfig runner;
    utils::LogConfig log;
};

}  // namespace ojrunner::config
