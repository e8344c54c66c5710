#include <tabedit/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <set>

namespace tabedit {

namespace {

bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

void PrintJsonError(const std::string& message, std::ostream& out) {
    nlohmann::json j;
    j["error"]["message"] = message;
    out << j.dump() << "\n";
}

// Consumes one --flag at argv[i] into args.flags and returns the next index.
int ParseFlag(int argc, const char* const* argv, int i, CommandArgs& args) {
    std::string_view arg{argv[i]};
    auto eq = arg.find('=');
    if (eq != std::string_view::npos) {
        args.flags[std::string(arg.substr(2, eq - 2))] = std::string(arg.substr(eq + 1));
        return i + 1;
    }
    auto key = std::string(arg.substr(2));
    if (CommandRouter::IsBooleanFlag(arg)) {
        args.flags[key] = "true";
        return i + 1;
    }
    if (i + 1 < argc && std::string_view{argv[i + 1]}.substr(0, 2) != "--") {
        args.flags[key] = argv[i + 1];
        return i + 2;
    }
    args.flags[key] = "true";
    return i + 1;
}

} // anonymous namespace

bool CommandRouter::IsBooleanFlag(std::string_view arg) {
    return arg == "--json" || arg == "--help" || arg == "--quiet" ||
           arg == "--verbose" || arg == "--no-fixup";
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler,
                             CommandHelp help) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    info.help = std::move(help);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::SetGroupDescription(const std::string& group,
                                        const std::string& description) {
    group_descriptions_[group] = description;
}

int CommandRouter::Dispatch(int argc, const char* const* argv,
                            std::ostream& out, std::ostream& err) const {
    bool json_mode = HasJsonFlag(argc, argv);
    auto parse_result = Parse(argc, argv);
    if (parse_result.IsErr()) {
        if (json_mode) {
            PrintJsonError(parse_result.Error(), err);
        } else {
            err << "Error: " << parse_result.Error() << "\n";
            PrintHelp(err);
        }
        return 1;
    }

    auto args = std::move(parse_result).Value();

    if (args.action.empty() || args.action == "help" || args.action == "-h") {
        if (HasGroup(args.group)) {
            PrintGroupHelp(args.group, out);
            return args.action.empty() && args.flags.count("help") == 0 ? 1 : 0;
        }
        if (json_mode) {
            PrintJsonError("Unknown command group '" + args.group + "'", err);
        } else {
            err << "Error: unknown command group '" << args.group << "'\n";
            PrintHelp(err);
        }
        return 1;
    }

    auto it = commands_.find(args.group + ":" + args.action);
    if (it == commands_.end()) {
        if (json_mode) {
            PrintJsonError("Unknown command '" + args.group + " " + args.action + "'", err);
        } else {
            err << "Error: unknown command '" << args.group << " " << args.action << "'\n";
            if (HasGroup(args.group)) {
                PrintGroupHelp(args.group, err);
            } else {
                PrintHelp(err);
            }
        }
        return 1;
    }

    if (args.flags.count("help") > 0) {
        PrintCommandHelp(args.group, args.action, out);
        return 0;
    }

    return it->second.handler(args);
}

Result<CommandArgs, std::string> CommandRouter::Parse(int argc, const char* const* argv) {
    CommandArgs args;
    int i = 1;

    // Global flags before the group.
    while (i < argc) {
        std::string_view arg{argv[i]};
        if (arg == "-v" || arg == "-vv" || arg == "-q") {
            ++i;
            continue;
        }
        if (arg == "-c" && i + 1 < argc) {
            args.flags["config"] = argv[i + 1];
            i += 2;
            continue;
        }
        if (arg.substr(0, 2) != "--") {
            break;
        }
        i = ParseFlag(argc, argv, i, args);
    }

    if (i >= argc) {
        return Result<CommandArgs, std::string>::Err(
            "Missing command group. Usage: tabedit <group> <action> [args]");
    }
    args.group = argv[i++];

    if (i < argc && std::string_view{argv[i]}.substr(0, 2) != "--") {
        args.action = argv[i++];
    }

    while (i < argc) {
        std::string_view arg{argv[i]};
        if (arg == "-v" || arg == "-vv" || arg == "-q") {
            ++i;
        } else if (arg == "-c" && i + 1 < argc) {
            args.flags["config"] = argv[i + 1];
            i += 2;
        } else if (arg.substr(0, 2) == "--") {
            i = ParseFlag(argc, argv, i, args);
        } else {
            args.positional.emplace_back(argv[i]);
            ++i;
        }
    }

    return Result<CommandArgs, std::string>::Ok(std::move(args));
}

std::vector<std::string> CommandRouter::Groups() const {
    std::set<std::string> groups;
    for (const auto& [key, info] : commands_) {
        groups.insert(info.group);
    }
    return {groups.begin(), groups.end()};
}

bool CommandRouter::HasGroup(const std::string& group) const {
    return std::any_of(commands_.begin(), commands_.end(),
                       [&](const auto& entry) { return entry.second.group == group; });
}

std::vector<CommandInfo> CommandRouter::CommandsForGroup(const std::string& group) const {
    std::vector<CommandInfo> result;
    for (const auto& [key, info] : commands_) {
        if (info.group == group) {
            result.push_back(info);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const CommandInfo& a, const CommandInfo& b) { return a.action < b.action; });
    return result;
}

std::string CommandRouter::GroupDescription(const std::string& group) const {
    auto it = group_descriptions_.find(group);
    return (it != group_descriptions_.end()) ? it->second : "";
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: tabedit <group> <action> [args] --model <file> [options]\n\n";
    out << "Available commands:\n";
    for (const auto& group : Groups()) {
        out << "\n  " << group << ":\n";
        for (const auto& cmd : CommandsForGroup(group)) {
            out << "    " << cmd.action;
            if (!cmd.description.empty()) {
                out << " - " << cmd.description;
            }
            out << "\n";
        }
    }
    out << "\nGlobal options:\n"
        << "  --model <file>      Model fixture (YAML)\n"
        << "  -c, --config <file> Config file (YAML)\n"
        << "  --json              JSON output\n"
        << "  --no-fixup          Do not rewrite dependent formulas\n"
        << "  --log-file <file>   Append JSON log lines to a file\n"
        << "  -v, -vv, --quiet    Verbosity\n\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group, std::ostream& out) const {
    auto desc = GroupDescription(group);
    if (desc.empty()) {
        desc = group;
    }
    out << "tabedit " << group << " - " << desc << "\n";

    out << "\nActions:\n";
    auto cmds = CommandsForGroup(group);
    size_t max_len = 0;
    for (const auto& cmd : cmds) {
        max_len = std::max(max_len, cmd.action.size());
    }
    for (const auto& cmd : cmds) {
        out << "  " << cmd.action << std::string(max_len - cmd.action.size() + 6, ' ')
            << cmd.description << "\n";
    }

    out << "\nUse \"tabedit " << group
        << " <action> --help\" for details on a specific action.\n";
}

void CommandRouter::PrintCommandHelp(const std::string& group,
                                     const std::string& action,
                                     std::ostream& out) const {
    auto it = commands_.find(group + ":" + action);
    if (it == commands_.end()) {
        out << "Error: unknown command '" << group << " " << action << "'\n";
        return;
    }

    const auto& cmd = it->second;
    out << "tabedit " << group << " " << action << " - " << cmd.description << "\n";

    if (!cmd.help) {
        return;
    }
    const auto& help = *cmd.help;

    if (!help.usage.empty()) {
        out << "\nUsage:\n  " << help.usage << "\n";
    }
    if (!help.args_description.empty()) {
        out << "\nArguments:\n  " << help.args_description << "\n";
    }
    if (!help.flags.empty()) {
        out << "\nFlags:\n";
        std::vector<std::string> displays;
        size_t max_len = 0;
        for (const auto& f : help.flags) {
            std::string display = "--" + f.name;
            if (!f.placeholder.empty()) {
                display += " " + f.placeholder;
            }
            max_len = std::max(max_len, display.size());
            displays.push_back(std::move(display));
        }
        for (size_t i = 0; i < help.flags.size(); ++i) {
            out << "  " << displays[i] << std::string(max_len - displays[i].size() + 4, ' ')
                << help.flags[i].description;
            if (help.flags[i].required) {
                out << " (required)";
            }
            out << "\n";
        }
    }
    if (!help.long_description.empty()) {
        out << "\n" << help.long_description << "\n";
    }
    if (!help.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : help.examples) {
            out << "  " << ex << "\n";
        }
    }
}

} // namespace tabedit
