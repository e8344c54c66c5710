#include <tabedit/cli/command_executor.hpp>
#include <tabedit/cli/command_router.hpp>
#include <tabedit/cli/output_formatter.hpp>
#include <tabedit/core/log.hpp>
#include <tabedit/core/version.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

bool HasArg(int argc, const char* const* argv, std::string_view a, std::string_view b = {}) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == a || (!b.empty() && arg == b)) {
            return true;
        }
    }
    return false;
}

// First argument that is neither a flag nor a flag value.
std::string_view FirstCommandWord(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "-c") {
            ++i;
            continue;
        }
        if (arg.substr(0, 1) == "-") {
            continue;
        }
        return arg;
    }
    return {};
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace tabedit;

    if (argc == 1) {
        CommandRouter router;
        RegisterAllCommands(router, AppConfig{});
        PrintTopLevelHelp(router, std::cout);
        return kExitSuccess;
    }

    if (HasArg(argc, argv, "--version")) {
        std::cout << "tabedit " << kVersion << "\n";
        return kExitSuccess;
    }

    auto command = FirstCommandWord(argc, argv);
    bool wants_help = HasArg(argc, argv, "--help", "-h") || command == "help";
    if (command.empty() || command == "help") {
        CommandRouter router;
        RegisterAllCommands(router, AppConfig{});
        PrintTopLevelHelp(router, std::cout);
        return wants_help ? kExitSuccess : 1;
    }

    auto config = ResolveConfig(argc, argv, !wants_help);
    if (config.IsErr()) {
        OutputFormatter fmt(HasArg(argc, argv, "--json"));
        fmt.PrintError(config.Error());
        return config.Error().ExitCode();
    }

    ConfigureLogging(config.Value());
    LogDebug("main", "tabedit " + std::string(kVersion) + " starting");

    CommandRouter router;
    RegisterAllCommands(router, config.Value());
    return router.Dispatch(argc, argv);
}
