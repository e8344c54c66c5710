#include <tabedit/cli/command_executor.hpp>

#include <tabedit/cli/output_formatter.hpp>
#include <tabedit/config/config_loader.hpp>
#include <tabedit/formula/dax_tokenizer.hpp>
#include <tabedit/io/edit_script.hpp>
#include <tabedit/io/model_json.hpp>
#include <tabedit/io/model_loader.hpp>
#include <tabedit/session/model_session.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tabedit {

namespace {

Error MakeValidationError(const std::string& message) {
    return Error{"Validation", "", message, ErrorCategory::InvalidValue};
}

std::string GetFlag(const CommandArgs& args, const std::string& key,
                    const std::string& default_val = "") {
    auto it = args.flags.find(key);
    return (it != args.flags.end()) ? it->second : default_val;
}

// Everything a handler needs to edit one model.
struct Workspace {
    DaxTokenizer tokenizer;
    std::unique_ptr<ModelSession> session;
};

Result<std::unique_ptr<Workspace>, Error> OpenWorkspace(const AppConfig& config) {
    using R = Result<std::unique_ptr<Workspace>, Error>;
    if (!config.model_file) {
        return R::Err(MakeValidationError("Missing required option: --model"));
    }
    auto ws = std::make_unique<Workspace>();
    SessionOptions options;
    options.formula_fixup = config.formula_fixup;
    ws->session = std::make_unique<ModelSession>(ws->tokenizer, options);
    auto loaded = LoadModelFromFile(*ws->session, *config.model_file);
    if (loaded.IsErr()) {
        return R::Err(std::move(loaded).Error());
    }
    return R::Ok(std::move(ws));
}

Result<ObjectId, Error> ResolvePath(const ModelSession& session, const std::string& path) {
    auto id = session.Find(path);
    if (!id) {
        return Result<ObjectId, Error>::Err(
            Error{"Find", path, "Object does not exist", ErrorCategory::NotFound});
    }
    return Result<ObjectId, Error>::Ok(*id);
}

std::vector<std::vector<std::string>> ModelRows(const Model& model) {
    std::vector<std::vector<std::string>> rows;
    for (auto id : model.Subtree(model.Root())) {
        if (id == model.Root()) {
            continue;
        }
        const Node& node = *model.Find(id);
        std::string detail;
        if (const auto* expression = ExpressionOf(node)) {
            detail = *expression;
        } else if (const auto* rel = std::get_if<RelationshipData>(&node.data)) {
            detail = model.PathOf(rel->from_column) + " -> " + model.PathOf(rel->to_column);
        } else if (const auto* annotation = std::get_if<AnnotationData>(&node.data)) {
            detail = annotation->value;
        }
        if (!node.error_message.empty()) {
            detail += "  [error: " + node.error_message + "]";
        }
        rows.push_back({model.PathOf(id), KindName(node.Kind()), detail});
    }
    return rows;
}

std::vector<std::pair<std::string, std::string>> PathEntries(const Model& model,
                                                             const std::vector<ObjectId>& ids) {
    std::vector<std::pair<std::string, std::string>> entries;
    for (auto id : ids) {
        const Node* node = model.Find(id);
        const std::string* expression = node != nullptr ? ExpressionOf(*node) : nullptr;
        entries.emplace_back(model.PathOf(id), expression != nullptr ? *expression : "");
    }
    return entries;
}

// Prints the expressions an edit touched.
void PrintEditOutcome(const OutputFormatter& fmt, const ModelSession& session,
                      const std::string& summary) {
    const auto& model = session.GetModel();
    const auto& report = session.LastFixupReport();
    if (fmt.IsJsonMode()) {
        nlohmann::json j;
        j["message"] = summary;
        j["fixup"] = FixupReportToJson(model, report);
        auto changed = nlohmann::json::array();
        for (auto id : report.rewritten) {
            changed.push_back({{"path", model.PathOf(id)},
                               {"expression", *ExpressionOf(*model.Find(id))}});
        }
        j["changed"] = std::move(changed);
        j["history"] = HistoryToJson(session.History());
        fmt.PrintJson(j);
        return;
    }
    fmt.PrintSuccess(summary);
    std::vector<DetailSection> sections;
    sections.push_back({"Rewritten", PathEntries(model, report.rewritten)});
    if (!report.flagged.empty()) {
        std::vector<std::pair<std::string, std::string>> flagged;
        for (auto id : report.flagged) {
            flagged.emplace_back(model.PathOf(id), model.Find(id)->error_message);
        }
        sections.push_back({"Flagged", std::move(flagged)});
    }
    fmt.PrintDetail("Formula fixup", sections);
}

// ---------------------------------------------------------------------------
// model show
// ---------------------------------------------------------------------------
int HandleModelShow(const CommandArgs& /*args*/, const AppConfig& config,
                    const OutputFormatter& fmt) {
    auto ws = OpenWorkspace(config);
    if (ws.IsErr()) {
        fmt.PrintError(ws.Error());
        return ws.Error().ExitCode();
    }
    const auto& model = ws.Value()->session->GetModel();
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(ModelToJson(model));
        return 0;
    }
    fmt.PrintTable({"Path", "Kind", "Expression"}, ModelRows(model));
    return 0;
}

// ---------------------------------------------------------------------------
// model deps
// ---------------------------------------------------------------------------
int HandleModelDeps(const CommandArgs& args, const AppConfig& config,
                    const OutputFormatter& fmt) {
    if (args.positional.empty()) {
        fmt.PrintError(MakeValidationError("Missing object path. Usage: tabedit model deps <path>"));
        return 3;
    }
    auto ws = OpenWorkspace(config);
    if (ws.IsErr()) {
        fmt.PrintError(ws.Error());
        return ws.Error().ExitCode();
    }
    const auto& session = *ws.Value()->session;
    auto id = ResolvePath(session, args.positional[0]);
    if (id.IsErr()) {
        fmt.PrintError(id.Error());
        return id.Error().ExitCode();
    }

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(DependenciesToJson(session, id.Value()));
        return 0;
    }

    const auto& model = session.GetModel();
    auto dependents = session.GetDependents(id.Value());
    auto dependencies = session.GetDependencies(id.Value());
    std::vector<DetailSection> sections;
    sections.push_back({"Dependents",
                        PathEntries(model, {dependents.begin(), dependents.end()})});
    sections.push_back({"Dependencies",
                        PathEntries(model, {dependencies.begin(), dependencies.end()})});
    sections.push_back({"Transitive dependents",
                        PathEntries(model, session.GetDependentsTransitive(id.Value()))});
    if (const auto* entry = session.Index().Entry(id.Value())) {
        DetailSection unresolved{"Unresolved", {}};
        for (const auto& ref : entry->unresolved) {
            unresolved.entries.emplace_back(ref.text, "");
        }
        if (entry->parse_error) {
            unresolved.entries.emplace_back("parse error", entry->parse_error->message);
        }
        sections.push_back(std::move(unresolved));
    }
    fmt.PrintDetail(model.PathOf(id.Value()), sections);
    return 0;
}

// ---------------------------------------------------------------------------
// edit rename / move / expr
// ---------------------------------------------------------------------------
int HandleEditRename(const CommandArgs& args, const AppConfig& config,
                     const OutputFormatter& fmt) {
    if (args.positional.size() < 2) {
        fmt.PrintError(MakeValidationError(
            "Missing arguments. Usage: tabedit edit rename <path> <new-name>"));
        return 3;
    }
    auto ws = OpenWorkspace(config);
    if (ws.IsErr()) {
        fmt.PrintError(ws.Error());
        return ws.Error().ExitCode();
    }
    auto& session = *ws.Value()->session;
    auto id = ResolvePath(session, args.positional[0]);
    if (id.IsErr()) {
        fmt.PrintError(id.Error());
        return id.Error().ExitCode();
    }
    auto renamed = session.Rename(id.Value(), args.positional[1]);
    if (renamed.IsErr()) {
        fmt.PrintError(renamed.Error());
        return renamed.Error().ExitCode();
    }
    PrintEditOutcome(fmt, session, "Renamed " + args.positional[0] + " to " +
                                       session.GetModel().PathOf(id.Value()));
    return 0;
}

int HandleEditMove(const CommandArgs& args, const AppConfig& config,
                   const OutputFormatter& fmt) {
    if (args.positional.size() < 2) {
        fmt.PrintError(MakeValidationError(
            "Missing arguments. Usage: tabedit edit move <path> <table>"));
        return 3;
    }
    auto ws = OpenWorkspace(config);
    if (ws.IsErr()) {
        fmt.PrintError(ws.Error());
        return ws.Error().ExitCode();
    }
    auto& session = *ws.Value()->session;
    auto id = ResolvePath(session, args.positional[0]);
    if (id.IsErr()) {
        fmt.PrintError(id.Error());
        return id.Error().ExitCode();
    }
    auto table = ResolvePath(session, args.positional[1]);
    if (table.IsErr()) {
        fmt.PrintError(table.Error());
        return table.Error().ExitCode();
    }
    auto moved = session.Move(id.Value(), table.Value());
    if (moved.IsErr()) {
        fmt.PrintError(moved.Error());
        return moved.Error().ExitCode();
    }
    PrintEditOutcome(fmt, session, "Moved " + args.positional[0] + " to " +
                                       session.GetModel().PathOf(id.Value()));
    return 0;
}

int HandleEditExpr(const CommandArgs& args, const AppConfig& config,
                   const OutputFormatter& fmt) {
    if (args.positional.size() < 2) {
        fmt.PrintError(MakeValidationError(
            "Missing arguments. Usage: tabedit edit expr <path> <expression>"));
        return 3;
    }
    auto ws = OpenWorkspace(config);
    if (ws.IsErr()) {
        fmt.PrintError(ws.Error());
        return ws.Error().ExitCode();
    }
    auto& session = *ws.Value()->session;
    auto id = ResolvePath(session, args.positional[0]);
    if (id.IsErr()) {
        fmt.PrintError(id.Error());
        return id.Error().ExitCode();
    }
    auto written = session.SetExpression(id.Value(), args.positional[1]);
    if (written.IsErr()) {
        fmt.PrintError(written.Error());
        return written.Error().ExitCode();
    }
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(DependenciesToJson(session, id.Value()));
    } else {
        fmt.PrintSuccess(args.positional[0] + " = " + args.positional[1]);
    }
    return 0;
}

// ---------------------------------------------------------------------------
// edit run
// ---------------------------------------------------------------------------
int HandleEditRun(const CommandArgs& args, const AppConfig& config,
                  const OutputFormatter& fmt) {
    auto script_path = GetFlag(args, "script", config.script_file.value_or(""));
    if (script_path.empty()) {
        fmt.PrintError(MakeValidationError(
            "Missing edit script. Usage: tabedit edit run --script <file>"));
        return 3;
    }
    auto steps = LoadEditScript(script_path);
    if (steps.IsErr()) {
        fmt.PrintError(steps.Error());
        return steps.Error().ExitCode();
    }
    auto ws = OpenWorkspace(config);
    if (ws.IsErr()) {
        fmt.PrintError(ws.Error());
        return ws.Error().ExitCode();
    }
    auto& session = *ws.Value()->session;
    auto ran = RunEditScript(session, steps.Value());
    if (ran.IsErr()) {
        fmt.PrintError(ran.Error());
        return ran.Error().ExitCode();
    }

    if (fmt.IsJsonMode()) {
        nlohmann::json j;
        j["steps"] = ran.Value().log;
        j["model"] = ModelToJson(session.GetModel());
        j["history"] = HistoryToJson(session.History());
        fmt.PrintJson(j);
        return 0;
    }

    fmt.PrintSuccess("Applied " + std::to_string(ran.Value().applied) + " step(s)");
    fmt.PrintTable({"Path", "Kind", "Expression"}, ModelRows(session.GetModel()));
    std::vector<DetailSection> history;
    DetailSection undo{"Undo", {}};
    for (const auto& label : session.History().UndoLabels()) {
        undo.entries.emplace_back(label, "");
    }
    DetailSection redo{"Redo", {}};
    for (const auto& label : session.History().RedoLabels()) {
        redo.entries.emplace_back(label, "");
    }
    history.push_back(std::move(undo));
    history.push_back(std::move(redo));
    fmt.PrintDetail("History", history);
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Configuration and logging
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(int argc, const char* const* argv, bool validate) {
    auto options = ExtractOptionArgs(argc, argv);
    std::vector<const char*> option_argv;
    option_argv.reserve(options.size());
    for (const auto& option : options) {
        option_argv.push_back(option.c_str());
    }

    auto cli = LoadFromCli(static_cast<int>(option_argv.size()), option_argv.data());
    if (cli.IsErr()) {
        return cli;
    }

    AppConfig config;
    if (auto config_path = FindConfigPath(argc, argv)) {
        auto yaml = LoadFromYaml(*config_path);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = MergeConfigs(yaml.Value(), cli.Value());
    } else {
        config = std::move(cli).Value();
    }

    if (validate) {
        auto valid = ValidateConfig(config);
        if (valid.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(valid).Error());
        }
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

LogLevel LogLevelFor(const AppConfig& config) {
    if (config.debug) {
        return LogLevel::Debug;
    }
    if (config.verbose) {
        return LogLevel::Info;
    }
    if (config.quiet) {
        return LogLevel::Error;
    }
    return LogLevel::Warn;
}

void ConfigureLogging(const AppConfig& config) {
    if (config.log_file) {
        InitGlobalLogger(std::make_unique<FileSink>(*config.log_file), LogLevelFor(config));
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(), LogLevelFor(config));
    }
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------
void RegisterAllCommands(CommandRouter& router, const AppConfig& config,
                         std::ostream& out, std::ostream& err) {
    auto bind = [&config, &out, &err](auto handler) {
        return [handler, config, &out, &err](const CommandArgs& args) {
            OutputFormatter fmt(config.json_output || GetFlag(args, "json") == "true",
                                config.quiet, out, err);
            return handler(args, config, fmt);
        };
    };

    router.SetGroupDescription("model", "Inspect a semantic model");
    router.SetGroupDescription("edit", "Edit a semantic model with formula fixup");

    router.Register("model", "show", "List every object with its expression",
                    bind(HandleModelShow),
                    CommandHelp{"tabedit model show --model <file> [--json]", "", "", {},
                                {"tabedit model show --model contoso.yaml"}});
    router.Register("model", "deps", "Show dependents and dependencies of an object",
                    bind(HandleModelDeps),
                    CommandHelp{"tabedit model deps <path> --model <file> [--json]",
                                "<path>    Object path (e.g. Sales/Total Sales)", "", {},
                                {"tabedit model deps Sales/Amount --model contoso.yaml"}});
    router.Register("edit", "rename", "Rename an object and rewrite references to it",
                    bind(HandleEditRename),
                    CommandHelp{"tabedit edit rename <path> <new-name> --model <file>",
                                "<path>    Object path\n  <new-name>    New object name",
                                "Dependent formulas are rewritten unless --no-fixup is given.",
                                {{"no-fixup", "", "Leave dependent formulas unchanged", false}},
                                {"tabedit edit rename Sales/Amount \"Net Amount\" --model contoso.yaml"}});
    router.Register("edit", "move", "Move a measure to another table",
                    bind(HandleEditMove),
                    CommandHelp{"tabedit edit move <path> <table> --model <file>",
                                "<path>    Measure path\n  <table>    Destination table",
                                "Qualified references Table[Measure] follow the measure.", {},
                                {"tabedit edit move \"Sales/Total Sales\" Finance --model contoso.yaml"}});
    router.Register("edit", "expr", "Replace the expression of a measure or calculated column",
                    bind(HandleEditExpr),
                    CommandHelp{"tabedit edit expr <path> <expression> --model <file>",
                                "<path>    Measure or calculated column path", "", {},
                                {"tabedit edit expr Sales/Margin \"[Amount] * 0.3\" --model contoso.yaml"}});
    router.Register("edit", "run", "Apply an edit script",
                    bind(HandleEditRun),
                    CommandHelp{"tabedit edit run --script <file> --model <file>", "", "",
                                {{"script", "<file>", "Edit script (YAML)", true}},
                                {"tabedit edit run --script rename.yaml --model contoso.yaml"}});
}

void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out) {
    out << "tabedit - semantic model editor with undo/redo and formula fixup\n";
    router.PrintHelp(out);
    out << "Examples:\n"
        << "  tabedit model show --model contoso.yaml\n"
        << "  tabedit edit rename Sales/Amount Revenue --model contoso.yaml --json\n"
        << "  tabedit edit run --script edits.yaml --model contoso.yaml\n";
}

} // namespace tabedit
