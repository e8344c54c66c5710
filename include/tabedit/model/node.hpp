#pragma once

#include <tabedit/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace tabedit {

// ---------------------------------------------------------------------------
// NodeKind — discriminator of the node payload variant. The enumerator order
// matches the alternative order of NodeData.
// ---------------------------------------------------------------------------
enum class NodeKind {
    Model,
    Table,
    DataColumn,
    CalculatedColumn,
    Measure,
    Relationship,
    Hierarchy,
    Perspective,
    Role,
    Annotation,
};

// -- Kind payloads ----------------------------------------------------------

struct ModelData {
    bool operator==(const ModelData&) const { return true; }
};

struct TableData {
    bool operator==(const TableData&) const { return true; }
};

struct DataColumnData {
    std::string data_type = "String";
    std::string source_column;

    bool operator==(const DataColumnData& o) const {
        return data_type == o.data_type && source_column == o.source_column;
    }
};

struct CalculatedColumnData {
    std::string expression;
    std::string data_type = "Variant";

    bool operator==(const CalculatedColumnData& o) const {
        return expression == o.expression && data_type == o.data_type;
    }
};

struct MeasureData {
    std::string expression;
    std::string format_string;

    bool operator==(const MeasureData& o) const {
        return expression == o.expression && format_string == o.format_string;
    }
};

struct RelationshipData {
    ObjectId from_column;
    ObjectId to_column;
    bool is_active = true;

    bool operator==(const RelationshipData& o) const {
        return from_column == o.from_column && to_column == o.to_column &&
               is_active == o.is_active;
    }
};

struct HierarchyData {
    bool operator==(const HierarchyData&) const { return true; }
};

struct PerspectiveData {
    bool operator==(const PerspectiveData&) const { return true; }
};

struct RoleData {
    std::string model_permission = "Read";

    bool operator==(const RoleData& o) const {
        return model_permission == o.model_permission;
    }
};

struct AnnotationData {
    std::string value;

    bool operator==(const AnnotationData& o) const { return value == o.value; }
};

using NodeData = std::variant<ModelData, TableData, DataColumnData,
                              CalculatedColumnData, MeasureData,
                              RelationshipData, HierarchyData,
                              PerspectiveData, RoleData, AnnotationData>;

// ---------------------------------------------------------------------------
// HasExpression — capability trait: the payload carries a formula expression
// that may reference other objects by name.
// ---------------------------------------------------------------------------
template <typename T>
struct HasExpression : std::false_type {};

template <>
struct HasExpression<CalculatedColumnData> : std::true_type {};

template <>
struct HasExpression<MeasureData> : std::true_type {};

// ---------------------------------------------------------------------------
// Node — one object of the semantic model.
// ---------------------------------------------------------------------------
struct Node {
    ObjectId id;
    std::string name;
    ObjectId parent;               // invalid for the model root
    std::string description;
    bool is_hidden = false;
    std::string error_message;     // set when a formula fixup could not be applied
    NodeData data;

    [[nodiscard]] NodeKind Kind() const noexcept {
        return static_cast<NodeKind>(data.index());
    }

    bool operator==(const Node& o) const {
        return id == o.id && name == o.name && parent == o.parent &&
               description == o.description && is_hidden == o.is_hidden &&
               error_message == o.error_message && data == o.data;
    }
    bool operator!=(const Node& o) const { return !(*this == o); }
};

[[nodiscard]] bool IsFormulaBearing(const Node& node);

// Expression text of a formula-bearing node; nullptr for other kinds.
[[nodiscard]] const std::string* ExpressionOf(const Node& node);
[[nodiscard]] std::string* MutableExpressionOf(Node& node);

[[nodiscard]] const char* KindName(NodeKind kind);
[[nodiscard]] std::optional<NodeKind> KindFromName(std::string_view name);

// Kinds sharing one name namespace under a parent map to the same family.
[[nodiscard]] NodeKind NameFamily(NodeKind kind);

[[nodiscard]] bool IsColumnKind(NodeKind kind);

// ---------------------------------------------------------------------------
// Property — addressable node attribute for generic reads/writes and undo.
// ---------------------------------------------------------------------------
enum class Property {
    Name,
    Parent,
    Expression,
    Description,
    IsHidden,
    FormatString,
    DataType,
    SourceColumn,
    IsActive,
    ModelPermission,
    Value,
    ErrorMessage,
};

using PropertyValue = std::variant<std::string, bool, ObjectId>;

[[nodiscard]] const char* PropertyName(Property property);
[[nodiscard]] std::optional<Property> PropertyFromName(std::string_view name);
[[nodiscard]] std::string FormatPropertyValue(const PropertyValue& value);

} // namespace tabedit
