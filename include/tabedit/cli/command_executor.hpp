#pragma once

#include <tabedit/cli/command_router.hpp>
#include <tabedit/config/app_config.hpp>
#include <tabedit/core/log.hpp>
#include <tabedit/core/result.hpp>

#include <iosfwd>
#include <iostream>

namespace tabedit {

// Builds the effective configuration of one invocation: -c/--config file
// merged with command-line options. `validate` is false for help requests.
Result<AppConfig, Error> ResolveConfig(int argc, const char* const* argv, bool validate);

// Log level selected by -v/-vv/--quiet.
[[nodiscard]] LogLevel LogLevelFor(const AppConfig& config);

// Installs the process logger: a JSON-lines file sink when log_file is set,
// stderr otherwise.
void ConfigureLogging(const AppConfig& config);

// Register the model and edit commands. Handlers read the model named by
// config.model_file and write to the given streams.
void RegisterAllCommands(CommandRouter& router, const AppConfig& config,
                         std::ostream& out = std::cout, std::ostream& err = std::cerr);

// Print top-level help (all groups, global flags, examples).
void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out);

} // namespace tabedit
