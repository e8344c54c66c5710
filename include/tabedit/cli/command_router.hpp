#pragma once

#include <tabedit/core/result.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

// ---------------------------------------------------------------------------
// CommandArgs — parsed command-line arguments for a specific command.
// ---------------------------------------------------------------------------
struct CommandArgs {
    std::string group;                   // e.g. "model", "edit"
    std::string action;                  // e.g. "show", "rename"
    std::vector<std::string> positional; // remaining positional arguments
    std::map<std::string, std::string> flags; // --key=value pairs
};

// Returns 0 on success, non-zero exit code on failure.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;        // e.g. "script"
    std::string placeholder; // e.g. "<file>"
    std::string description;
    bool required = false;
};

struct CommandHelp {
    std::string usage;            // e.g. "tabedit edit rename <path> <name> [flags]"
    std::string args_description; // e.g. "<path>    Object path (e.g. Sales/Total)"
    std::string long_description;
    std::vector<FlagHelp> flags;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string group;
    std::string action;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter — two-level dispatch for CLI commands.
//
// Commands are registered as group/action pairs. The router parses argv,
// extracts the group and action, and dispatches to the registered handler.
//
// Usage:
//   CommandRouter router;
//   router.Register("model", "show", "List model objects", handler);
//   return router.Dispatch(argc, argv);
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    CommandRouter() = default;

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler);

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler,
                  CommandHelp help);

    void SetGroupDescription(const std::string& group,
                             const std::string& description);

    // Parse argv and dispatch to the matching handler.
    // Returns the exit code from the handler, or 1 on routing error.
    // Intercepts --help/-h at group and command levels.
    int Dispatch(int argc, const char* const* argv,
                 std::ostream& out = std::cout, std::ostream& err = std::cerr) const;

    static Result<CommandArgs, std::string> Parse(int argc, const char* const* argv);

    // True for flags that never consume the next token (--json, --quiet, ...).
    static bool IsBooleanFlag(std::string_view arg);

    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;
    [[nodiscard]] std::string GroupDescription(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group,
                          const std::string& action,
                          std::ostream& out) const;

private:
    // Key: "group:action"
    std::map<std::string, CommandInfo> commands_;
    std::map<std::string, std::string> group_descriptions_;
};

} // namespace tabedit
