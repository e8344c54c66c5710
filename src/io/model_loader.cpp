#include <tabedit/io/model_loader.hpp>

#include <tabedit/core/log.hpp>

#include <yaml-cpp/yaml.h>


namespace tabedit {

namespace {

Error MakeLoaderError(const std::string& message) {
    return Error{"LoadModel", "", message, ErrorCategory::ParseError};
}

Result<std::string, Error> RequiredName(const YAML::Node& node, const std::string& what) {
    if (!node.IsMap() || !node["name"]) {
        return Result<std::string, Error>::Err(
            MakeLoaderError(what + " entry missing 'name' field"));
    }
    return Result<std::string, Error>::Ok(node["name"].as<std::string>());
}

std::string StringOr(const YAML::Node& node, const char* key, const std::string& fallback) {
    return node[key] ? node[key].as<std::string>() : fallback;
}

// Description, hidden flag and annotations shared by every object entry.
Result<void, Error> ApplyCommon(ModelSession& session, ObjectId id, const YAML::Node& node) {
    if (node["description"]) {
        auto r = session.SetProperty(id, Property::Description,
                                     PropertyValue(node["description"].as<std::string>()));
        if (r.IsErr()) return r;
    }
    if (node["hidden"]) {
        auto r = session.SetProperty(id, Property::IsHidden,
                                     PropertyValue(node["hidden"].as<bool>()));
        if (r.IsErr()) return r;
    }
    if (node["annotations"]) {
        for (const auto& annotation : node["annotations"]) {
            auto name = RequiredName(annotation, "Annotation");
            if (name.IsErr()) return Result<void, Error>::Err(name.Error());
            auto added = session.AddAnnotation(id, name.Value(),
                                               StringOr(annotation, "value", ""));
            if (added.IsErr()) return Result<void, Error>::Err(added.Error());
        }
    }
    return Result<void, Error>::Ok();
}

Result<ObjectId, Error> ResolveColumn(const ModelSession& session, const YAML::Node& node,
                                      const char* key) {
    if (!node[key]) {
        return Result<ObjectId, Error>::Err(
            MakeLoaderError(std::string("Relationship entry missing '") + key + "' field"));
    }
    auto path = node[key].as<std::string>();
    auto id = session.Find(path);
    if (!id) {
        return Result<ObjectId, Error>::Err(Error{
            "LoadModel", path, "Relationship endpoint does not exist", ErrorCategory::NotFound});
    }
    return Result<ObjectId, Error>::Ok(*id);
}

Result<void, Error> LoadTable(ModelSession& session, const YAML::Node& node) {
    auto name = RequiredName(node, "Table");
    if (name.IsErr()) return Result<void, Error>::Err(name.Error());
    auto table = session.AddTable(name.Value());
    if (table.IsErr()) return Result<void, Error>::Err(table.Error());
    const auto table_id = table.Value();

    if (node["columns"]) {
        for (const auto& column : node["columns"]) {
            auto column_name = RequiredName(column, "Column");
            if (column_name.IsErr()) return Result<void, Error>::Err(column_name.Error());
            Result<ObjectId, Error> added =
                column["expression"]
                    ? session.AddCalculatedColumn(table_id, column_name.Value(),
                                                  column["expression"].as<std::string>(),
                                                  StringOr(column, "data_type", "Variant"))
                    : session.AddDataColumn(table_id, column_name.Value(),
                                            StringOr(column, "data_type", "String"),
                                            StringOr(column, "source_column", ""));
            if (added.IsErr()) return Result<void, Error>::Err(added.Error());
            auto common = ApplyCommon(session, added.Value(), column);
            if (common.IsErr()) return common;
        }
    }

    if (node["measures"]) {
        for (const auto& measure : node["measures"]) {
            auto measure_name = RequiredName(measure, "Measure");
            if (measure_name.IsErr()) return Result<void, Error>::Err(measure_name.Error());
            auto added = session.AddMeasure(table_id, measure_name.Value(),
                                            StringOr(measure, "expression", ""),
                                            StringOr(measure, "format_string", ""));
            if (added.IsErr()) return Result<void, Error>::Err(added.Error());
            auto common = ApplyCommon(session, added.Value(), measure);
            if (common.IsErr()) return common;
        }
    }

    if (node["hierarchies"]) {
        for (const auto& hierarchy : node["hierarchies"]) {
            auto hierarchy_name = RequiredName(hierarchy, "Hierarchy");
            if (hierarchy_name.IsErr()) return Result<void, Error>::Err(hierarchy_name.Error());
            auto added = session.AddHierarchy(table_id, hierarchy_name.Value());
            if (added.IsErr()) return Result<void, Error>::Err(added.Error());
            auto common = ApplyCommon(session, added.Value(), hierarchy);
            if (common.IsErr()) return common;
        }
    }

    return ApplyCommon(session, table_id, node);
}

Result<void, Error> LoadDocument(ModelSession& session, const YAML::Node& root) {
    if (!root.IsMap()) {
        return Result<void, Error>::Err(MakeLoaderError("Model document must be a mapping"));
    }
    if (root["name"]) {
        auto renamed = session.Rename(session.GetModel().Root(), root["name"].as<std::string>());
        if (renamed.IsErr()) return renamed;
    }

    if (root["tables"]) {
        for (const auto& table : root["tables"]) {
            auto loaded = LoadTable(session, table);
            if (loaded.IsErr()) return loaded;
        }
    }

    if (root["relationships"]) {
        for (const auto& rel : root["relationships"]) {
            auto from = ResolveColumn(session, rel, "from");
            if (from.IsErr()) return Result<void, Error>::Err(from.Error());
            auto to = ResolveColumn(session, rel, "to");
            if (to.IsErr()) return Result<void, Error>::Err(to.Error());
            auto added = session.AddRelationship(from.Value(), to.Value(),
                                                 StringOr(rel, "name", ""),
                                                 rel["active"] ? rel["active"].as<bool>() : true);
            if (added.IsErr()) return Result<void, Error>::Err(added.Error());
            auto common = ApplyCommon(session, added.Value(), rel);
            if (common.IsErr()) return common;
        }
    }

    if (root["roles"]) {
        for (const auto& role : root["roles"]) {
            auto name = RequiredName(role, "Role");
            if (name.IsErr()) return Result<void, Error>::Err(name.Error());
            auto added = session.AddRole(name.Value(), StringOr(role, "permission", "Read"));
            if (added.IsErr()) return Result<void, Error>::Err(added.Error());
            auto common = ApplyCommon(session, added.Value(), role);
            if (common.IsErr()) return common;
        }
    }

    if (root["perspectives"]) {
        for (const auto& perspective : root["perspectives"]) {
            auto name = RequiredName(perspective, "Perspective");
            if (name.IsErr()) return Result<void, Error>::Err(name.Error());
            auto added = session.AddPerspective(name.Value());
            if (added.IsErr()) return Result<void, Error>::Err(added.Error());
            auto common = ApplyCommon(session, added.Value(), perspective);
            if (common.IsErr()) return common;
        }
    }

    return ApplyCommon(session, session.GetModel().Root(), root);
}

Result<void, Error> Replay(ModelSession& session, const YAML::Node& root) {
    const auto depth_before = session.History().UndoDepth();
    session.BeginBatch("Load model");
    Result<void, Error> loaded = Result<void, Error>::Ok();
    try {
        loaded = LoadDocument(session, root);
    } catch (const YAML::Exception& e) {
        loaded = Result<void, Error>::Err(
            MakeLoaderError("Malformed model document: " + std::string(e.what())));
    }
    session.EndBatch();

    if (loaded.IsErr()) {
        if (session.History().UndoDepth() > depth_before) {
            session.Undo();
        }
        session.Clear();
        LogError("loader", loaded.Error().ToString());
        return loaded;
    }
    session.Clear();
    LogInfo("loader", "Loaded model '" + session.GetModel().Find(session.GetModel().Root())->name +
                          "' with " + std::to_string(session.GetModel().Size()) + " object(s)");
    return loaded;
}

} // anonymous namespace

Result<void, Error> LoadModelFromString(ModelSession& session, std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return Result<void, Error>::Err(
            MakeLoaderError("Failed to parse YAML: " + std::string(e.what())));
    }
    return Replay(session, root);
}

Result<void, Error> LoadModelFromFile(ModelSession& session, std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<void, Error>::Err(MakeLoaderError(
            "Failed to parse YAML file '" + std::string(file_path) + "': " + e.what()));
    }
    return Replay(session, root);
}

} // namespace tabedit
