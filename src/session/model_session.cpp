#include <tabedit/session/model_session.hpp>

#include <tabedit/core/log.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tabedit {

namespace {

Error SessionError(const std::string& operation, const std::string& target,
                   const std::string& message, ErrorCategory category) {
    return Error{operation, target, message, category};
}

Error Renamed(Error error, const std::string& operation) {
    error.operation = operation;
    return error;
}

} // anonymous namespace

ModelSession::ModelSession(const ITokenizer& tokenizer, SessionOptions options)
    : options_(std::move(options)),
      model_(options_.model_name),
      index_(tokenizer),
      fixup_(index_, tokenizer, FixupOptions{options_.formula_fixup}) {}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------
void ModelSession::BeginBatch(const std::string& label) {
    history_.BeginBatch(label);
}

void ModelSession::EndBatch() {
    history_.EndBatch();
}

bool ModelSession::Undo() {
    return history_.Undo(*this);
}

bool ModelSession::Redo() {
    return history_.Redo(*this);
}

void ModelSession::Clear() {
    history_.Clear();
    LogDebug("session", "History cleared");
}

void ModelSession::SetFormulaFixup(bool enabled) {
    fixup_.SetOptions(FixupOptions{enabled});
}

void ModelSession::RequireNotReplaying(const char* operation) const {
    if (history_.IsReplaying()) {
        throw std::logic_error(std::string(operation) + " called during " +
                               UndoStateName(history_.State()));
    }
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
std::optional<ObjectId> ModelSession::Find(std::string_view path) const {
    return model_.FindByPath(path);
}

std::set<ObjectId> ModelSession::GetDependents(ObjectId id) const {
    return index_.GetDependents(id);
}

std::set<ObjectId> ModelSession::GetDependencies(ObjectId id) const {
    return index_.GetDependencies(id);
}

std::vector<ObjectId> ModelSession::GetDependentsTransitive(ObjectId id) const {
    return index_.GetDependentsTransitive(id);
}

// ---------------------------------------------------------------------------
// Creation
// ---------------------------------------------------------------------------
Result<ObjectId, Error> ModelSession::AddNode(Node node, const std::string& operation) {
    RequireNotReplaying(operation.c_str());
    node.id = model_.AllocateId();
    auto inserted = model_.Insert(node);
    if (inserted.IsErr()) {
        LogDebug("session", operation + " rejected: " + inserted.Error().message);
        return Result<ObjectId, Error>::Err(Renamed(std::move(inserted).Error(), operation));
    }
    const auto id = node.id;
    history_.Add(AddNodeAction{std::move(node)});
    index_.OnNodeAdded(model_, id);
    LogDebug("session", "Added " + std::string(KindName(model_.Find(id)->Kind())) + " '" +
                            model_.PathOf(id) + "' " + id.ToString());
    return Result<ObjectId, Error>::Ok(id);
}

Result<ObjectId, Error> ModelSession::AddTable(const std::string& name) {
    Node node;
    node.name = name;
    node.parent = model_.Root();
    node.data = TableData{};
    return AddNode(std::move(node), "AddTable");
}

Result<ObjectId, Error> ModelSession::AddDataColumn(ObjectId table, const std::string& name,
                                                    const std::string& data_type,
                                                    const std::string& source_column) {
    Node node;
    node.name = name;
    node.parent = table;
    node.data = DataColumnData{data_type, source_column};
    return AddNode(std::move(node), "AddDataColumn");
}

Result<ObjectId, Error> ModelSession::AddCalculatedColumn(ObjectId table,
                                                          const std::string& name,
                                                          const std::string& expression,
                                                          const std::string& data_type) {
    Node node;
    node.name = name;
    node.parent = table;
    node.data = CalculatedColumnData{expression, data_type};
    return AddNode(std::move(node), "AddCalculatedColumn");
}

Result<ObjectId, Error> ModelSession::AddMeasure(ObjectId table, const std::string& name,
                                                 const std::string& expression,
                                                 const std::string& format_string) {
    Node node;
    node.name = name;
    node.parent = table;
    node.data = MeasureData{expression, format_string};
    return AddNode(std::move(node), "AddMeasure");
}

Result<ObjectId, Error> ModelSession::AddRelationship(ObjectId from_column,
                                                      ObjectId to_column,
                                                      const std::string& name,
                                                      bool is_active) {
    Node node;
    node.name = name;
    if (node.name.empty()) {
        node.name = model_.PathOf(from_column) + " -> " + model_.PathOf(to_column);
    }
    node.parent = model_.Root();
    node.data = RelationshipData{from_column, to_column, is_active};
    return AddNode(std::move(node), "AddRelationship");
}

Result<ObjectId, Error> ModelSession::AddHierarchy(ObjectId table, const std::string& name) {
    Node node;
    node.name = name;
    node.parent = table;
    node.data = HierarchyData{};
    return AddNode(std::move(node), "AddHierarchy");
}

Result<ObjectId, Error> ModelSession::AddPerspective(const std::string& name) {
    Node node;
    node.name = name;
    node.parent = model_.Root();
    node.data = PerspectiveData{};
    return AddNode(std::move(node), "AddPerspective");
}

Result<ObjectId, Error> ModelSession::AddRole(const std::string& name,
                                              const std::string& model_permission) {
    Node node;
    node.name = name;
    node.parent = model_.Root();
    node.data = RoleData{model_permission};
    return AddNode(std::move(node), "AddRole");
}

Result<ObjectId, Error> ModelSession::AddAnnotation(ObjectId parent, const std::string& name,
                                                    const std::string& value) {
    Node node;
    node.name = name;
    node.parent = parent;
    node.data = AnnotationData{value};
    return AddNode(std::move(node), "AddAnnotation");
}

// ---------------------------------------------------------------------------
// Removal
// ---------------------------------------------------------------------------
Result<void, Error> ModelSession::RemoveOne(ObjectId id) {
    auto erased = model_.Erase(id);
    if (erased.IsErr()) {
        return Result<void, Error>::Err(Renamed(std::move(erased).Error(), "RemoveNode"));
    }
    history_.Add(RemoveNodeAction{std::move(erased).Value()});
    index_.OnNodeRemoved(model_, id);
    return Result<void, Error>::Ok();
}

Result<void, Error> ModelSession::RemoveNode(ObjectId id) {
    RequireNotReplaying("RemoveNode");
    if (id == model_.Root()) {
        return Result<void, Error>::Err(SessionError(
            "RemoveNode", model_.PathOf(id), "The model root cannot be removed",
            ErrorCategory::InvalidValue));
    }
    if (!model_.Contains(id)) {
        return Result<void, Error>::Err(SessionError(
            "RemoveNode", id.ToString(), "Object does not exist", ErrorCategory::NotFound));
    }

    const auto subtree = model_.Subtree(id);
    const std::set<ObjectId> removed(subtree.begin(), subtree.end());

    // Relationships go first so that undo re-inserts them after their columns.
    std::vector<ObjectId> order;
    for (auto rel : model_.NodesOfKind(NodeKind::Relationship)) {
        if (removed.count(rel) > 0) {
            continue;
        }
        const auto& data = std::get<RelationshipData>(model_.Find(rel)->data);
        if (removed.count(data.from_column) > 0 || removed.count(data.to_column) > 0) {
            auto rel_tree = model_.Subtree(rel);
            order.insert(order.end(), rel_tree.rbegin(), rel_tree.rend());
        }
    }
    order.insert(order.end(), subtree.rbegin(), subtree.rend());

    const auto path = model_.PathOf(id);
    BatchScope batch(history_, "Remove " + path);
    for (auto victim : order) {
        auto result = RemoveOne(victim);
        if (result.IsErr()) {
            return result;
        }
    }
    LogInfo("session", "Removed '" + path + "' (" + std::to_string(order.size()) +
                           " object(s))");
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Property writes
// ---------------------------------------------------------------------------
Result<void, Error> ModelSession::SetAndRecord(ObjectId id, Property property,
                                               const PropertyValue& value,
                                               bool notify_index) {
    auto old = model_.SetProperty(id, property, value);
    if (old.IsErr()) {
        return Result<void, Error>::Err(std::move(old).Error());
    }
    history_.Add(PropertySetAction{id, property, old.Value(), value});
    if (notify_index) {
        NotifyIndex(id, property, old.Value(), value);
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ModelSession::Relocate(ObjectId id, Property property,
                                           const PropertyValue& value,
                                           const std::string& operation) {
    RequireNotReplaying(operation.c_str());
    last_stage_ = FixupStage::Validating;
    last_report_ = FixupReport{};

    auto valid = model_.ValidateProperty(id, property, value);
    if (valid.IsErr()) {
        last_stage_ = FixupStage::Rejected;
        LogDebug("session", operation + " rejected: " + valid.Error().message);
        return Result<void, Error>::Err(Renamed(std::move(valid).Error(), operation));
    }
    auto current = model_.GetProperty(id, property);
    if (current.IsOk() && current.Value() == value) {
        last_stage_ = FixupStage::Committed;
        return Result<void, Error>::Ok();
    }

    const Node& node = *model_.Find(id);
    FixupChange change;
    change.target = id;
    change.old_name = node.name;
    change.new_name = node.name;
    change.old_table = node.parent;
    change.new_table = node.parent;
    std::string label;
    if (property == Property::Name) {
        change.kind = FixupChangeKind::Rename;
        change.new_name = std::get<std::string>(value);
        label = "Rename " + model_.PathOf(id) + " to " + change.new_name;
    } else {
        change.kind = FixupChangeKind::Move;
        change.new_table = std::get<ObjectId>(value);
        label = "Move " + model_.PathOf(id) + " to " + model_.PathOf(change.new_table);
    }

    BatchScope batch(history_, label);

    last_stage_ = FixupStage::Applying;
    auto applied = SetAndRecord(id, property, value, false);
    if (applied.IsErr()) {
        last_stage_ = FixupStage::Rejected;
        return Result<void, Error>::Err(Renamed(std::move(applied).Error(), operation));
    }

    last_stage_ = FixupStage::Indexing;
    auto plan = fixup_.Plan(model_, change);

    last_stage_ = FixupStage::Rewriting;
    auto report = fixup_.Apply(plan, *this);
    index_.OnNodeChanged(model_, id);
    if (report.IsErr()) {
        LogError("session", operation + " failed while rewriting dependents: " +
                                report.Error().message);
        return Result<void, Error>::Err(Renamed(std::move(report).Error(), operation));
    }

    last_report_ = std::move(report).Value();
    last_stage_ = FixupStage::Committed;
    LogInfo("session", label + ": rewrote " + std::to_string(last_report_.rewritten.size()) +
                           " expression(s), flagged " +
                           std::to_string(last_report_.flagged.size()));
    return Result<void, Error>::Ok();
}

Result<void, Error> ModelSession::Rename(ObjectId id, const std::string& name) {
    return Relocate(id, Property::Name, PropertyValue(name), "Rename");
}

Result<void, Error> ModelSession::Move(ObjectId id, ObjectId new_table) {
    return Relocate(id, Property::Parent, PropertyValue(new_table), "Move");
}

Result<void, Error> ModelSession::SetExpression(ObjectId id, const std::string& text) {
    RequireNotReplaying("SetExpression");
    auto valid = model_.ValidateProperty(id, Property::Expression, PropertyValue(text));
    if (valid.IsErr()) {
        return Result<void, Error>::Err(Renamed(std::move(valid).Error(), "SetExpression"));
    }
    const Node& node = *model_.Find(id);
    if (*ExpressionOf(node) == text) {
        return Result<void, Error>::Ok();
    }
    const bool clear_error = !node.error_message.empty();

    BatchScope batch(history_, "Set expression of " + model_.PathOf(id));
    auto written = SetAndRecord(id, Property::Expression, PropertyValue(text), true);
    if (written.IsErr()) {
        return Result<void, Error>::Err(Renamed(std::move(written).Error(), "SetExpression"));
    }
    if (clear_error) {
        auto cleared = SetAndRecord(id, Property::ErrorMessage, PropertyValue(std::string()), false);
        if (cleared.IsErr()) {
            return Result<void, Error>::Err(Renamed(std::move(cleared).Error(), "SetExpression"));
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ModelSession::SetProperty(ObjectId id, Property property,
                                              const PropertyValue& value) {
    RequireNotReplaying("SetProperty");
    if (property == Property::Name && std::holds_alternative<std::string>(value)) {
        return Rename(id, std::get<std::string>(value));
    }
    if (property == Property::Parent && std::holds_alternative<ObjectId>(value)) {
        return Move(id, std::get<ObjectId>(value));
    }
    if (property == Property::Expression && std::holds_alternative<std::string>(value)) {
        return SetExpression(id, std::get<std::string>(value));
    }

    auto valid = model_.ValidateProperty(id, property, value);
    if (valid.IsErr()) {
        return Result<void, Error>::Err(Renamed(std::move(valid).Error(), "SetProperty"));
    }
    auto current = model_.GetProperty(id, property);
    if (current.IsOk() && current.Value() == value) {
        return Result<void, Error>::Ok();
    }
    return SetAndRecord(id, property, value, true);
}

// ---------------------------------------------------------------------------
// IExpressionWriter
// ---------------------------------------------------------------------------
Result<void, Error> ModelSession::WriteExpression(ObjectId id, const std::string& text) {
    return SetExpression(id, text);
}

Result<void, Error> ModelSession::FlagExpressionError(ObjectId id, const std::string& message) {
    const Node* node = model_.Find(id);
    if (node != nullptr && node->error_message == message) {
        return Result<void, Error>::Ok();
    }
    return SetAndRecord(id, Property::ErrorMessage, PropertyValue(message), false);
}

// ---------------------------------------------------------------------------
// Replay
// ---------------------------------------------------------------------------
void ModelSession::NotifyIndex(ObjectId id, Property property, const PropertyValue& old_value,
                               const PropertyValue& new_value) {
    switch (property) {
        case Property::Expression:
            index_.OnExpressionChanged(model_, id, std::get<std::string>(old_value),
                                       std::get<std::string>(new_value));
            break;
        case Property::Name:
        case Property::Parent:
            index_.OnNodeChanged(model_, id);
            break;
        default:
            break;
    }
}

void ModelSession::ReplayProperty(ObjectId id, Property property,
                                  const PropertyValue& expected, const PropertyValue& value) {
    auto current = model_.GetProperty(id, property);
    if (current.IsErr() || current.Value() != expected) {
        throw std::logic_error("Replay mismatch on " + id.ToString() + "." +
                               PropertyName(property) + ": expected " +
                               FormatPropertyValue(expected));
    }
    auto old = model_.SetProperty(id, property, value);
    if (old.IsErr()) {
        throw std::logic_error("Replay rejected: " + old.Error().ToString());
    }
    NotifyIndex(id, property, expected, value);
}

void ModelSession::ReplayInsert(const Node& node) {
    auto inserted = model_.Insert(node);
    if (inserted.IsErr()) {
        throw std::logic_error("Replay rejected: " + inserted.Error().ToString());
    }
    index_.OnNodeAdded(model_, node.id);
}

void ModelSession::ReplayErase(const Node& expected) {
    const Node* current = model_.Find(expected.id);
    if (current == nullptr || *current != expected) {
        throw std::logic_error("Replay mismatch: " + expected.id.ToString() +
                               " is missing or differs from the recorded node");
    }
    auto erased = model_.Erase(expected.id);
    if (erased.IsErr()) {
        throw std::logic_error("Replay rejected: " + erased.Error().ToString());
    }
    index_.OnNodeRemoved(model_, expected.id);
}

void ModelSession::ApplyForward(const Action& action) {
    if (const auto* set = std::get_if<PropertySetAction>(&action)) {
        ReplayProperty(set->target, set->property, set->old_value, set->new_value);
    } else if (const auto* add = std::get_if<AddNodeAction>(&action)) {
        ReplayInsert(add->node);
    } else {
        ReplayErase(std::get<RemoveNodeAction>(action).node);
    }
}

void ModelSession::ApplyInverse(const Action& action) {
    if (const auto* set = std::get_if<PropertySetAction>(&action)) {
        ReplayProperty(set->target, set->property, set->new_value, set->old_value);
    } else if (const auto* add = std::get_if<AddNodeAction>(&action)) {
        ReplayErase(add->node);
    } else {
        ReplayInsert(std::get<RemoveNodeAction>(action).node);
    }
}

} // namespace tabedit
