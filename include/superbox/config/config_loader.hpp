#pragma once

#include <superbox/config/app_config.hpp>
#include <superbox/core/result.hpp>

#include <string_view>

namespace superbox {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI flags (subcommand and positionals already removed).
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields of cli_overrides that differ from their defaults
// replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that the values are usable for `command`.
Result<void, Error> ValidateConfig(const AppConfig& config, Subcommand command);

} // namespace superbox
