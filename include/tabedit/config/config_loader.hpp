#pragma once

#include <tabedit/config/app_config.hpp>
#include <tabedit/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

// Parse a YAML config file into an AppConfig.
//
//   model: models/contoso.yaml
//   script: edits/rename.yaml
//   log_file: tabedit.log
//   json_output: false
//   verbose: false
//   quiet: false
//   formula_fixup: true
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse option flags into an AppConfig. Command tokens (group, action,
// positional arguments) must already be removed; see ExtractOptionArgs.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Keeps argv[0] and the option flags (with their values) of a full command
// line. --key=value is split into two tokens.
std::vector<std::string> ExtractOptionArgs(int argc, const char* const* argv);

// Path given by -c/--config, if any.
std::optional<std::string> FindConfigPath(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that required fields are present and values are consistent.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace tabedit
