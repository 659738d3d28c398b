#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "toolchain/toolchain_resolver.hpp"

namespace ojrunner::config {

// $OJRUNNER_CONFIG, else ~/.ojrunner/config.json.
std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file at `path` when it exists, then environment overrides.
Config LoadConfig(const std::filesystem::path& path,
                  const toolchain::EnvLookup& env = toolchain::ProcessEnvLookup());

Config LoadConfig();

}  // namespace ojrunner::config
