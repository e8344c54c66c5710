#include <tabedit/io/model_json.hpp>

namespace tabedit {

namespace {

template <typename Ids>
nlohmann::json Paths(const Model& model, const Ids& ids) {
    auto arr = nlohmann::json::array();
    for (auto id : ids) {
        arr.push_back(model.PathOf(id));
    }
    return arr;
}

} // anonymous namespace

nlohmann::json NodeToJson(const Model& model, const Node& node) {
    nlohmann::json j;
    j["id"] = node.id.Value();
    j["kind"] = KindName(node.Kind());
    j["name"] = node.name;
    j["path"] = model.PathOf(node.id);
    if (node.parent.IsValid()) {
        j["parent"] = node.parent.Value();
    }
    if (!node.description.empty()) {
        j["description"] = node.description;
    }
    if (node.is_hidden) {
        j["hidden"] = true;
    }
    if (const auto* expression = ExpressionOf(node)) {
        j["expression"] = *expression;
    }
    if (!node.error_message.empty()) {
        j["error_message"] = node.error_message;
    }

    if (const auto* column = std::get_if<DataColumnData>(&node.data)) {
        j["data_type"] = column->data_type;
        if (!column->source_column.empty()) {
            j["source_column"] = column->source_column;
        }
    } else if (const auto* calc = std::get_if<CalculatedColumnData>(&node.data)) {
        j["data_type"] = calc->data_type;
    } else if (const auto* measure = std::get_if<MeasureData>(&node.data)) {
        if (!measure->format_string.empty()) {
            j["format_string"] = measure->format_string;
        }
    } else if (const auto* rel = std::get_if<RelationshipData>(&node.data)) {
        j["from"] = model.PathOf(rel->from_column);
        j["to"] = model.PathOf(rel->to_column);
        j["active"] = rel->is_active;
    } else if (const auto* role = std::get_if<RoleData>(&node.data)) {
        j["permission"] = role->model_permission;
    } else if (const auto* annotation = std::get_if<AnnotationData>(&node.data)) {
        j["value"] = annotation->value;
    }
    return j;
}

nlohmann::json ModelToJson(const Model& model) {
    nlohmann::json j;
    j["name"] = model.Find(model.Root())->name;
    auto objects = nlohmann::json::array();
    auto ids = model.Subtree(model.Root());
    for (auto id : ids) {
        if (id != model.Root()) {
            objects.push_back(NodeToJson(model, *model.Find(id)));
        }
    }
    j["objects"] = std::move(objects);
    return j;
}

nlohmann::json DependenciesToJson(const ModelSession& session, ObjectId id) {
    const auto& model = session.GetModel();
    nlohmann::json j;
    j["object"] = model.PathOf(id);
    j["dependents"] = Paths(model, session.GetDependents(id));
    j["dependencies"] = Paths(model, session.GetDependencies(id));
    j["transitive_dependents"] = Paths(model, session.GetDependentsTransitive(id));
    if (const auto* entry = session.Index().Entry(id)) {
        auto unresolved = nlohmann::json::array();
        for (const auto& ref : entry->unresolved) {
            unresolved.push_back(ref.text);
        }
        j["unresolved"] = std::move(unresolved);
        if (entry->parse_error) {
            j["parse_error"] = entry->parse_error->message;
        }
    }
    return j;
}

nlohmann::json HistoryToJson(const UndoManager& history) {
    nlohmann::json j;
    j["undo"] = history.UndoLabels();
    j["redo"] = history.RedoLabels();
    return j;
}

nlohmann::json FixupReportToJson(const Model& model, const FixupReport& report) {
    nlohmann::json j;
    j["rewritten"] = Paths(model, report.rewritten);
    j["flagged"] = Paths(model, report.flagged);
    j["spans_replaced"] = report.spans_replaced;
    return j;
}

} // namespace tabedit
