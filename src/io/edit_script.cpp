#include <tabedit/io/edit_script.hpp>

#include <tabedit/core/log.hpp>

#include <yaml-cpp/yaml.h>

#include <array>
#include <utility>

namespace tabedit {

namespace {

constexpr std::array<std::pair<StepKind, const char*>, 9> kStepNames = {{
    {StepKind::Rename, "rename"},
    {StepKind::Move, "move"},
    {StepKind::SetExpression, "set_expression"},
    {StepKind::AddMeasure, "add_measure"},
    {StepKind::Remove, "remove"},
    {StepKind::Undo, "undo"},
    {StepKind::Redo, "redo"},
    {StepKind::BeginBatch, "begin_batch"},
    {StepKind::EndBatch, "end_batch"},
}};

Error MakeScriptError(const std::string& message) {
    return Error{"EditScript", "", message, ErrorCategory::ParseError};
}

Result<std::string, Error> Required(const YAML::Node& node, const char* key,
                                    std::size_t index, const char* op) {
    if (!node[key]) {
        return Result<std::string, Error>::Err(MakeScriptError(
            "Step " + std::to_string(index + 1) + " (" + op + ") missing '" + key + "' field"));
    }
    return Result<std::string, Error>::Ok(node[key].as<std::string>());
}

Result<EditStep, Error> ParseStep(const YAML::Node& node, std::size_t index) {
    using R = Result<EditStep, Error>;
    if (!node.IsMap() || !node["op"]) {
        return R::Err(MakeScriptError("Step " + std::to_string(index + 1) +
                                      " missing 'op' field"));
    }
    const auto op = node["op"].as<std::string>();
    EditStep step;
    bool known = false;
    for (const auto& [kind, name] : kStepNames) {
        if (op == name) {
            step.kind = kind;
            known = true;
        }
    }
    if (!known) {
        return R::Err(MakeScriptError("Step " + std::to_string(index + 1) +
                                      " has unknown op '" + op + "'"));
    }

    auto take = [&](const char* key, std::string& field) -> Result<void, Error> {
        auto value = Required(node, key, index, op.c_str());
        if (value.IsErr()) {
            return Result<void, Error>::Err(std::move(value).Error());
        }
        field = std::move(value).Value();
        return Result<void, Error>::Ok();
    };

    Result<void, Error> fields = Result<void, Error>::Ok();
    switch (step.kind) {
        case StepKind::Rename:
            fields = take("path", step.path);
            if (fields.IsOk()) fields = take("name", step.name);
            break;
        case StepKind::Move:
            fields = take("path", step.path);
            if (fields.IsOk()) fields = take("table", step.table);
            break;
        case StepKind::SetExpression:
            fields = take("path", step.path);
            if (fields.IsOk()) fields = take("expression", step.expression);
            break;
        case StepKind::AddMeasure:
            fields = take("table", step.table);
            if (fields.IsOk()) fields = take("name", step.name);
            if (fields.IsOk()) fields = take("expression", step.expression);
            break;
        case StepKind::Remove:
            fields = take("path", step.path);
            break;
        case StepKind::BeginBatch:
            step.label = node["label"] ? node["label"].as<std::string>() : "Script batch";
            break;
        case StepKind::Undo:
        case StepKind::Redo:
        case StepKind::EndBatch:
            break;
    }
    if (fields.IsErr()) {
        return R::Err(std::move(fields).Error());
    }
    return R::Ok(std::move(step));
}

Result<std::vector<EditStep>, Error> ParseRoot(const YAML::Node& root) {
    using R = Result<std::vector<EditStep>, Error>;
    const YAML::Node steps = root.IsMap() ? root["steps"] : root;
    if (!steps || !steps.IsSequence()) {
        return R::Err(MakeScriptError("Edit script must contain a 'steps' list"));
    }
    std::vector<EditStep> result;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        auto step = ParseStep(steps[i], i);
        if (step.IsErr()) {
            return R::Err(std::move(step).Error());
        }
        result.push_back(std::move(step).Value());
    }
    return R::Ok(std::move(result));
}

Result<ObjectId, Error> Resolve(const ModelSession& session, const std::string& path,
                                const char* operation) {
    auto id = session.Find(path);
    if (!id) {
        return Result<ObjectId, Error>::Err(
            Error{operation, path, "Object does not exist", ErrorCategory::NotFound});
    }
    return Result<ObjectId, Error>::Ok(*id);
}

Result<std::string, Error> Apply(ModelSession& session, const EditStep& step, int& opened) {
    using R = Result<std::string, Error>;
    auto done = [](Result<void, Error> r, std::string line) {
        return r.IsErr() ? R::Err(std::move(r).Error()) : R::Ok(std::move(line));
    };

    switch (step.kind) {
        case StepKind::Rename: {
            auto id = Resolve(session, step.path, "Rename");
            if (id.IsErr()) return R::Err(id.Error());
            return done(session.Rename(id.Value(), step.name),
                        "rename " + step.path + " -> " + step.name);
        }
        case StepKind::Move: {
            auto id = Resolve(session, step.path, "Move");
            if (id.IsErr()) return R::Err(id.Error());
            auto table = Resolve(session, step.table, "Move");
            if (table.IsErr()) return R::Err(table.Error());
            return done(session.Move(id.Value(), table.Value()),
                        "move " + step.path + " -> " + step.table);
        }
        case StepKind::SetExpression: {
            auto id = Resolve(session, step.path, "SetExpression");
            if (id.IsErr()) return R::Err(id.Error());
            return done(session.SetExpression(id.Value(), step.expression),
                        "set_expression " + step.path);
        }
        case StepKind::AddMeasure: {
            auto table = Resolve(session, step.table, "AddMeasure");
            if (table.IsErr()) return R::Err(table.Error());
            auto added = session.AddMeasure(table.Value(), step.name, step.expression);
            if (added.IsErr()) return R::Err(added.Error());
            return R::Ok("add_measure " + step.table + "/" + step.name);
        }
        case StepKind::Remove: {
            auto id = Resolve(session, step.path, "RemoveNode");
            if (id.IsErr()) return R::Err(id.Error());
            return done(session.RemoveNode(id.Value()), "remove " + step.path);
        }
        case StepKind::Undo:
            return R::Ok(session.Undo() ? "undo" : "undo (nothing to undo)");
        case StepKind::Redo:
            return R::Ok(session.Redo() ? "redo" : "redo (nothing to redo)");
        case StepKind::BeginBatch:
            session.BeginBatch(step.label);
            ++opened;
            return R::Ok("begin_batch " + step.label);
        case StepKind::EndBatch:
            if (opened == 0) {
                return R::Err(Error{"EndBatch", "", "end_batch without a matching begin_batch",
                                    ErrorCategory::InvalidValue});
            }
            session.EndBatch();
            --opened;
            return R::Ok("end_batch");
    }
    return R::Err(Error{"EditScript", "", "Unhandled step", ErrorCategory::Internal});
}

} // anonymous namespace

const char* StepKindName(StepKind kind) {
    for (const auto& [k, name] : kStepNames) {
        if (k == kind) {
            return name;
        }
    }
    return "unknown";
}

Result<std::vector<EditStep>, Error> ParseEditScript(std::string_view yaml) {
    try {
        return ParseRoot(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        return Result<std::vector<EditStep>, Error>::Err(
            MakeScriptError("Failed to parse edit script: " + std::string(e.what())));
    }
}

Result<std::vector<EditStep>, Error> LoadEditScript(std::string_view file_path) {
    try {
        return ParseRoot(YAML::LoadFile(std::string(file_path)));
    } catch (const YAML::Exception& e) {
        return Result<std::vector<EditStep>, Error>::Err(MakeScriptError(
            "Failed to parse edit script '" + std::string(file_path) + "': " + e.what()));
    }
}

Result<ScriptResult, Error> RunEditScript(ModelSession& session,
                                          const std::vector<EditStep>& steps) {
    ScriptResult result;
    int opened = 0;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];
        if (opened > 0 && (step.kind == StepKind::Undo || step.kind == StepKind::Redo)) {
            while (opened > 0) {
                session.EndBatch();
                --opened;
            }
            return Result<ScriptResult, Error>::Err(
                Error{StepKindName(step.kind), "", "Step " + std::to_string(i + 1) +
                                                       " cannot run inside an open batch",
                      ErrorCategory::InvalidValue});
        }
        auto applied = Apply(session, step, opened);
        if (applied.IsErr()) {
            while (opened > 0) {
                session.EndBatch();
                --opened;
            }
            auto error = std::move(applied).Error();
            LogWarn("script", "Step " + std::to_string(i + 1) + " failed: " + error.message);
            return Result<ScriptResult, Error>::Err(std::move(error));
        }
        LogDebug("script", applied.Value());
        result.log.push_back(std::move(applied).Value());
        ++result.applied;
    }
    while (opened > 0) {
        LogWarn("script", "Closing batch left open at end of script");
        session.EndBatch();
        --opened;
    }
    return Result<ScriptResult, Error>::Ok(std::move(result));
}

} // namespace tabedit
