#include <tabedit/model/model.hpp>

#include <algorithm>
#include <array>

namespace tabedit {

namespace {

constexpr std::array<const char*, 8> kDataTypes = {
    "String", "Int64", "Double", "Decimal", "DateTime", "Boolean", "Binary", "Variant",
};

constexpr std::array<const char*, 5> kModelPermissions = {
    "None", "Read", "ReadRefresh", "Refresh", "Administrator",
};

const char* ValueTypeName(const PropertyValue& value) {
    switch (value.index()) {
        case 0: return "string";
        case 1: return "bool";
        case 2: return "object id";
    }
    return "unknown";
}

// Expected variant alternative for each property.
std::size_t ExpectedValueIndex(Property property) {
    switch (property) {
        case Property::IsHidden:
        case Property::IsActive:
            return 1;
        case Property::Parent:
            return 2;
        default:
            return 0;
    }
}

bool AppliesTo(Property property, const Node& node) {
    const auto kind = node.Kind();
    switch (property) {
        case Property::Name:
        case Property::Description:
            return true;
        case Property::Parent:
            return kind != NodeKind::Model;
        case Property::IsHidden:
            return kind != NodeKind::Model && kind != NodeKind::Annotation;
        case Property::Expression:
        case Property::ErrorMessage:
            return IsFormulaBearing(node);
        case Property::FormatString:
            return kind == NodeKind::Measure;
        case Property::DataType:
            return IsColumnKind(kind);
        case Property::SourceColumn:
            return kind == NodeKind::DataColumn;
        case Property::IsActive:
            return kind == NodeKind::Relationship;
        case Property::ModelPermission:
            return kind == NodeKind::Role;
        case Property::Value:
            return kind == NodeKind::Annotation;
    }
    return false;
}

// Pointer to the string slot a property lives in, or nullptr.
std::string* StringSlot(Node& node, Property property) {
    switch (property) {
        case Property::Name:         return &node.name;
        case Property::Description:  return &node.description;
        case Property::ErrorMessage: return &node.error_message;
        case Property::Expression:   return MutableExpressionOf(node);
        case Property::FormatString:
            if (auto* m = std::get_if<MeasureData>(&node.data)) return &m->format_string;
            return nullptr;
        case Property::DataType:
            if (auto* c = std::get_if<DataColumnData>(&node.data)) return &c->data_type;
            if (auto* c = std::get_if<CalculatedColumnData>(&node.data)) return &c->data_type;
            return nullptr;
        case Property::SourceColumn:
            if (auto* c = std::get_if<DataColumnData>(&node.data)) return &c->source_column;
            return nullptr;
        case Property::ModelPermission:
            if (auto* r = std::get_if<RoleData>(&node.data)) return &r->model_permission;
            return nullptr;
        case Property::Value:
            if (auto* a = std::get_if<AnnotationData>(&node.data)) return &a->value;
            return nullptr;
        default:
            return nullptr;
    }
}

bool* BoolSlot(Node& node, Property property) {
    if (property == Property::IsHidden) {
        return &node.is_hidden;
    }
    if (property == Property::IsActive) {
        if (auto* r = std::get_if<RelationshipData>(&node.data)) return &r->is_active;
    }
    return nullptr;
}

} // anonymous namespace

bool IsKnownDataType(std::string_view data_type) {
    return std::any_of(kDataTypes.begin(), kDataTypes.end(),
                       [&](const char* t) { return data_type == t; });
}

bool IsKnownModelPermission(std::string_view permission) {
    return std::any_of(kModelPermissions.begin(), kModelPermissions.end(),
                       [&](const char* p) { return permission == p; });
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Model::Model(std::string name) {
    Node root;
    root.id = ObjectId(1);
    root.name = std::move(name);
    root.data = ModelData{};
    nodes_.emplace(root.id, std::move(root));
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------
const Node* Model::Find(ObjectId id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

Node* Model::FindMutable(ObjectId id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<ObjectId> Model::Children(ObjectId parent) const {
    auto it = children_.find(parent);
    if (it == children_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

std::vector<ObjectId> Model::ChildrenOfKind(ObjectId parent, NodeKind kind) const {
    std::vector<ObjectId> result;
    for (auto id : Children(parent)) {
        if (nodes_.at(id).Kind() == kind) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<ObjectId> Model::NodesOfKind(NodeKind kind) const {
    std::vector<ObjectId> result;
    for (const auto& [id, node] : nodes_) {
        if (node.Kind() == kind) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<ObjectId> Model::Subtree(ObjectId id) const {
    std::vector<ObjectId> result;
    if (!Contains(id)) {
        return result;
    }
    std::vector<ObjectId> stack{id};
    while (!stack.empty()) {
        auto current = stack.back();
        stack.pop_back();
        result.push_back(current);
        auto kids = Children(current);
        // Push in reverse so the lowest id is visited first.
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return result;
}

std::optional<ObjectId> Model::FindTable(std::string_view name) const {
    for (auto id : ChildrenOfKind(Root(), NodeKind::Table)) {
        if (NamesEqual(nodes_.at(id).name, name)) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<ObjectId> Model::FindChild(ObjectId parent, std::string_view name) const {
    for (auto id : Children(parent)) {
        if (NamesEqual(nodes_.at(id).name, name)) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<ObjectId> Model::FindColumn(ObjectId table, std::string_view name) const {
    for (auto id : Children(table)) {
        const auto& node = nodes_.at(id);
        if (IsColumnKind(node.Kind()) && NamesEqual(node.name, name)) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<ObjectId> Model::FindMeasure(std::string_view name) const {
    for (const auto& [id, node] : nodes_) {
        if (node.Kind() == NodeKind::Measure && NamesEqual(node.name, name)) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<ObjectId> Model::FindMeasureInTable(ObjectId table,
                                                  std::string_view name) const {
    for (auto id : ChildrenOfKind(table, NodeKind::Measure)) {
        if (NamesEqual(nodes_.at(id).name, name)) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<ObjectId> Model::FindByPath(std::string_view path) const {
    if (path.empty()) {
        return std::nullopt;
    }
    // A model-level object whose name contains '/' wins over a nested path.
    if (auto whole = FindChild(Root(), path)) {
        return whole;
    }
    ObjectId current = Root();
    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto slash = path.find('/', pos);
        auto segment = path.substr(pos, slash == std::string_view::npos
                                            ? std::string_view::npos
                                            : slash - pos);
        auto next = FindChild(current, segment);
        if (!next) {
            return std::nullopt;
        }
        current = *next;
        if (slash == std::string_view::npos) {
            break;
        }
        pos = slash + 1;
    }
    return current;
}

std::string Model::PathOf(ObjectId id) const {
    const Node* node = Find(id);
    if (node == nullptr) {
        return id.ToString();
    }
    if (id == Root()) {
        return node->name;
    }
    std::string path = node->name;
    for (const Node* p = Find(node->parent); p != nullptr && p->id != Root();
         p = Find(p->parent)) {
        path = p->name + "/" + path;
    }
    return path;
}

std::optional<ObjectId> Model::TableOf(ObjectId id) const {
    for (const Node* node = Find(id); node != nullptr; node = Find(node->parent)) {
        if (node->Kind() == NodeKind::Table) {
            return node->id;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
Error Model::MakeError(const std::string& operation, ObjectId id,
                       const std::string& message,
                       ErrorCategory category) const {
    return Error{operation, id.IsValid() ? PathOf(id) : std::string(), message, category};
}

Result<void, Error> Model::ValidateName(ObjectId self, NodeKind kind,
                                        ObjectId parent,
                                        std::string_view name) const {
    auto valid = ObjectName::Create(name);
    if (valid.IsErr()) {
        return Result<void, Error>::Err(
            MakeError("ValidateName", self, valid.Error(), ErrorCategory::InvalidValue));
    }

    const auto family = NameFamily(kind);
    for (auto sibling : Children(parent)) {
        if (sibling == self) {
            continue;
        }
        const auto& other = nodes_.at(sibling);
        if (NameFamily(other.Kind()) == family && NamesEqual(other.name, name)) {
            return Result<void, Error>::Err(MakeError(
                "ValidateName", self,
                std::string(KindName(other.Kind())) + " '" + PathOf(sibling) +
                    "' already uses the name '" + std::string(name) + "'",
                ErrorCategory::NameConflict));
        }
    }

    // Unqualified [X] references resolve to the owner table's columns first
    // and to measures model-wide, so those namespaces must not overlap.
    if (kind == NodeKind::Measure) {
        for (const auto& [id, other] : nodes_) {
            if (id != self && other.Kind() == NodeKind::Measure &&
                NamesEqual(other.name, name)) {
                return Result<void, Error>::Err(MakeError(
                    "ValidateName", self,
                    "Measure '" + PathOf(id) + "' already uses the name '" +
                        std::string(name) + "'",
                    ErrorCategory::NameConflict));
            }
        }
        if (auto column = FindColumn(parent, name); column && *column != self) {
            return Result<void, Error>::Err(MakeError(
                "ValidateName", self,
                "Column '" + PathOf(*column) + "' already uses the name '" +
                    std::string(name) + "'",
                ErrorCategory::NameConflict));
        }
    } else if (IsColumnKind(kind)) {
        if (auto measure = FindMeasureInTable(parent, name); measure && *measure != self) {
            return Result<void, Error>::Err(MakeError(
                "ValidateName", self,
                "Measure '" + PathOf(*measure) + "' already uses the name '" +
                    std::string(name) + "'",
                ErrorCategory::NameConflict));
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> Model::ValidatePlacement(NodeKind kind, ObjectId parent,
                                             ErrorCategory category) const {
    const Node* parent_node = Find(parent);
    if (kind == NodeKind::Model) {
        return Result<void, Error>::Err(MakeError(
            "ValidatePlacement", parent, "A model has exactly one root", category));
    }
    if (parent_node == nullptr) {
        return Result<void, Error>::Err(MakeError(
            "ValidatePlacement", ObjectId(), "Parent " + parent.ToString() + " does not exist",
            category));
    }

    const auto parent_kind = parent_node->Kind();
    bool allowed = false;
    switch (kind) {
        case NodeKind::Table:
        case NodeKind::Relationship:
        case NodeKind::Perspective:
        case NodeKind::Role:
            allowed = parent_kind == NodeKind::Model;
            break;
        case NodeKind::DataColumn:
        case NodeKind::CalculatedColumn:
        case NodeKind::Measure:
        case NodeKind::Hierarchy:
            allowed = parent_kind == NodeKind::Table;
            break;
        case NodeKind::Annotation:
            allowed = parent_kind != NodeKind::Annotation;
            break;
        case NodeKind::Model:
            break;
    }
    if (!allowed) {
        return Result<void, Error>::Err(MakeError(
            "ValidatePlacement", parent,
            std::string(KindName(kind)) + " cannot be placed under a " +
                KindName(parent_kind),
            category));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> Model::ValidateNode(const Node& node) const {
    if (!node.id.IsValid()) {
        return Result<void, Error>::Err(MakeError(
            "Insert", ObjectId(), "Node has no id", ErrorCategory::Internal));
    }
    if (Contains(node.id)) {
        return Result<void, Error>::Err(MakeError(
            "Insert", node.id, "Id " + node.id.ToString() + " is already in use",
            ErrorCategory::Internal));
    }

    auto placement = ValidatePlacement(node.Kind(), node.parent, ErrorCategory::InvalidValue);
    if (placement.IsErr()) {
        return placement;
    }
    auto name = ValidateName(ObjectId(), node.Kind(), node.parent, node.name);
    if (name.IsErr()) {
        return name;
    }

    if (const auto* column = std::get_if<DataColumnData>(&node.data)) {
        if (!IsKnownDataType(column->data_type)) {
            return Result<void, Error>::Err(MakeError(
                "Insert", ObjectId(), "Unknown data type '" + column->data_type + "'",
                ErrorCategory::InvalidValue));
        }
    }
    if (const auto* column = std::get_if<CalculatedColumnData>(&node.data)) {
        if (!IsKnownDataType(column->data_type)) {
            return Result<void, Error>::Err(MakeError(
                "Insert", ObjectId(), "Unknown data type '" + column->data_type + "'",
                ErrorCategory::InvalidValue));
        }
    }
    if (const auto* role = std::get_if<RoleData>(&node.data)) {
        if (!IsKnownModelPermission(role->model_permission)) {
            return Result<void, Error>::Err(MakeError(
                "Insert", ObjectId(),
                "Unknown model permission '" + role->model_permission + "'",
                ErrorCategory::InvalidValue));
        }
    }
    if (const auto* rel = std::get_if<RelationshipData>(&node.data)) {
        const Node* from = Find(rel->from_column);
        const Node* to = Find(rel->to_column);
        if (from == nullptr || to == nullptr ||
            !IsColumnKind(from->Kind()) || !IsColumnKind(to->Kind())) {
            return Result<void, Error>::Err(MakeError(
                "Insert", ObjectId(), "Relationship endpoints must be existing columns",
                ErrorCategory::InvalidValue));
        }
        if (from->parent == to->parent) {
            return Result<void, Error>::Err(MakeError(
                "Insert", ObjectId(),
                "Relationship endpoints must belong to two different tables",
                ErrorCategory::InvalidValue));
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> Model::ValidateProperty(ObjectId id, Property property,
                                            const PropertyValue& value) const {
    const Node* node = Find(id);
    if (node == nullptr) {
        return Result<void, Error>::Err(MakeError(
            "SetProperty", ObjectId(), "Object " + id.ToString() + " does not exist",
            ErrorCategory::NotFound));
    }
    if (!AppliesTo(property, *node)) {
        return Result<void, Error>::Err(MakeError(
            "SetProperty", id,
            std::string(KindName(node->Kind())) + " has no property " +
                PropertyName(property),
            property == Property::Parent ? ErrorCategory::InvalidMove
                                         : ErrorCategory::InvalidValue));
    }
    if (value.index() != ExpectedValueIndex(property)) {
        return Result<void, Error>::Err(MakeError(
            "SetProperty", id,
            std::string("Property ") + PropertyName(property) + " does not accept a " +
                ValueTypeName(value),
            ErrorCategory::InvalidValue));
    }

    switch (property) {
        case Property::Name:
            return ValidateName(id, node->Kind(), node->parent, std::get<std::string>(value));
        case Property::Parent: {
            const auto new_parent = std::get<ObjectId>(value);
            if (node->Kind() != NodeKind::Measure) {
                return Result<void, Error>::Err(MakeError(
                    "Move", id,
                    std::string("Only measures can be moved, not a ") + KindName(node->Kind()),
                    ErrorCategory::InvalidMove));
            }
            auto placement = ValidatePlacement(node->Kind(), new_parent,
                                               ErrorCategory::InvalidMove);
            if (placement.IsErr()) {
                return placement;
            }
            return ValidateName(id, node->Kind(), new_parent, node->name);
        }
        case Property::DataType:
            if (!IsKnownDataType(std::get<std::string>(value))) {
                return Result<void, Error>::Err(MakeError(
                    "SetProperty", id,
                    "Unknown data type '" + std::get<std::string>(value) + "'",
                    ErrorCategory::InvalidValue));
            }
            break;
        case Property::ModelPermission:
            if (!IsKnownModelPermission(std::get<std::string>(value))) {
                return Result<void, Error>::Err(MakeError(
                    "SetProperty", id,
                    "Unknown model permission '" + std::get<std::string>(value) + "'",
                    ErrorCategory::InvalidValue));
            }
            break;
        default:
            break;
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Storage
// ---------------------------------------------------------------------------
ObjectId Model::AllocateId() {
    return ObjectId(next_id_++);
}

Result<PropertyValue, Error> Model::GetProperty(ObjectId id, Property property) const {
    const Node* node = Find(id);
    if (node == nullptr) {
        return Result<PropertyValue, Error>::Err(MakeError(
            "GetProperty", ObjectId(), "Object " + id.ToString() + " does not exist",
            ErrorCategory::NotFound));
    }
    if (!AppliesTo(property, *node)) {
        return Result<PropertyValue, Error>::Err(MakeError(
            "GetProperty", id,
            std::string(KindName(node->Kind())) + " has no property " +
                PropertyName(property),
            ErrorCategory::InvalidValue));
    }
    if (property == Property::Parent) {
        return Result<PropertyValue, Error>::Ok(PropertyValue(node->parent));
    }
    // Slots are only written through SetProperty; the copy keeps this const.
    Node copy = *node;
    if (auto* b = BoolSlot(copy, property)) {
        return Result<PropertyValue, Error>::Ok(PropertyValue(*b));
    }
    if (auto* s = StringSlot(copy, property)) {
        return Result<PropertyValue, Error>::Ok(PropertyValue(*s));
    }
    return Result<PropertyValue, Error>::Err(MakeError(
        "GetProperty", id, std::string("Unreadable property ") + PropertyName(property),
        ErrorCategory::Internal));
}

Result<PropertyValue, Error> Model::SetProperty(ObjectId id, Property property,
                                                const PropertyValue& value) {
    auto valid = ValidateProperty(id, property, value);
    if (valid.IsErr()) {
        return Result<PropertyValue, Error>::Err(std::move(valid).Error());
    }
    auto old = GetProperty(id, property);
    if (old.IsErr()) {
        return old;
    }

    Node& node = *FindMutable(id);
    if (property == Property::Parent) {
        const auto new_parent = std::get<ObjectId>(value);
        children_[node.parent].erase(id);
        node.parent = new_parent;
        children_[new_parent].insert(id);
    } else if (auto* b = BoolSlot(node, property)) {
        *b = std::get<bool>(value);
    } else if (auto* s = StringSlot(node, property)) {
        *s = std::get<std::string>(value);
    }
    return old;
}

Result<void, Error> Model::Insert(Node node) {
    auto valid = ValidateNode(node);
    if (valid.IsErr()) {
        return valid;
    }
    next_id_ = std::max(next_id_, node.id.Value() + 1);
    const auto id = node.id;
    const auto parent = node.parent;
    nodes_.emplace(id, std::move(node));
    children_[parent].insert(id);
    return Result<void, Error>::Ok();
}

Result<Node, Error> Model::Erase(ObjectId id) {
    if (id == Root()) {
        return Result<Node, Error>::Err(MakeError(
            "Erase", id, "The model root cannot be removed", ErrorCategory::InvalidValue));
    }
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Result<Node, Error>::Err(MakeError(
            "Erase", ObjectId(), "Object " + id.ToString() + " does not exist",
            ErrorCategory::NotFound));
    }
    auto kids = children_.find(id);
    if (kids != children_.end() && !kids->second.empty()) {
        return Result<Node, Error>::Err(MakeError(
            "Erase", id, "Object still has children", ErrorCategory::Internal));
    }
    if (kids != children_.end()) {
        children_.erase(kids);
    }
    Node node = std::move(it->second);
    nodes_.erase(it);
    children_[node.parent].erase(id);
    return Result<Node, Error>::Ok(std::move(node));
}

} // namespace tabedit
