#include <tabedit/config/config_loader.hpp>

#include <tabedit/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <stdexcept>

namespace tabedit {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", message, ErrorCategory::ConfigError};
}

// Flags that never take a value.
bool IsSwitch(std::string_view arg) {
    return arg == "--json" || arg == "-v" || arg == "--verbose" || arg == "-vv" ||
           arg == "-q" || arg == "--quiet" || arg == "--no-fixup" || arg == "--help" ||
           arg == "-h";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Config file must contain a mapping"));
    }

    AppConfig config;
    try {
        if (root["model"]) {
            config.model_file = root["model"].as<std::string>();
        }
        if (root["script"]) {
            config.script_file = root["script"].as<std::string>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
        if (root["formula_fixup"]) {
            config.formula_fixup = root["formula_fixup"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in config file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("tabedit", kVersion, argparse::default_arguments::none);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--model")
        .help("Model fixture (YAML)");
    program.add_argument("--script")
        .help("Edit script (YAML)");
    program.add_argument("--log-file")
        .help("Append JSON log lines to this file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-fixup")
        .help("Do not rewrite dependent formulas on rename or move")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    if (auto val = program.present("--model")) {
        config.model_file = *val;
    }
    if (auto val = program.present("--script")) {
        config.script_file = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("-vv")) {
        config.verbose = true;
        config.debug = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    if (program.get<bool>("--no-fixup")) {
        config.formula_fixup = false;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

std::vector<std::string> ExtractOptionArgs(int argc, const char* const* argv) {
    std::vector<std::string> out;
    if (argc > 0) {
        out.emplace_back(argv[0]);
    }
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty() || arg.front() != '-' || arg == "-") {
            continue;
        }
        auto eq = arg.find('=');
        if (arg.substr(0, 2) == "--" && eq != std::string_view::npos) {
            out.emplace_back(arg.substr(0, eq));
            out.emplace_back(arg.substr(eq + 1));
            continue;
        }
        out.emplace_back(arg);
        if (!IsSwitch(arg) && i + 1 < argc) {
            out.emplace_back(argv[++i]);
        }
    }
    return out;
}

std::optional<std::string> FindConfigPath(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
        if (arg.substr(0, 9) == "--config=") {
            return std::string(arg.substr(9));
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (cli_overrides.model_file.has_value()) {
        merged.model_file = cli_overrides.model_file;
    }
    if (cli_overrides.script_file.has_value()) {
        merged.script_file = cli_overrides.script_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.debug) {
        merged.debug = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (!cli_overrides.formula_fixup) {
        merged.formula_fixup = false;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (!config.model_file.has_value() || config.model_file->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required option: --model"));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("--verbose and --quiet cannot be combined"));
    }
    if (!std::ifstream(*config.model_file).good()) {
        return Result<void, Error>::Err(
            MakeConfigError("Model file not found: " + *config.model_file));
    }
    if (config.script_file.has_value() && !std::ifstream(*config.script_file).good()) {
        return Result<void, Error>::Err(
            MakeConfigError("Script file not found: " + *config.script_file));
    }
    return Result<void, Error>::Ok();
}

} // namespace tabedit
