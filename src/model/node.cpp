#include <tabedit/model/node.hpp>

#include <array>
#include <utility>

namespace tabedit {

namespace {

constexpr std::array<std::pair<NodeKind, const char*>, 10> kKindNames = {{
    {NodeKind::Model, "Model"},
    {NodeKind::Table, "Table"},
    {NodeKind::DataColumn, "DataColumn"},
    {NodeKind::CalculatedColumn, "CalculatedColumn"},
    {NodeKind::Measure, "Measure"},
    {NodeKind::Relationship, "Relationship"},
    {NodeKind::Hierarchy, "Hierarchy"},
    {NodeKind::Perspective, "Perspective"},
    {NodeKind::Role, "Role"},
    {NodeKind::Annotation, "Annotation"},
}};

constexpr std::array<std::pair<Property, const char*>, 12> kPropertyNames = {{
    {Property::Name, "Name"},
    {Property::Parent, "Parent"},
    {Property::Expression, "Expression"},
    {Property::Description, "Description"},
    {Property::IsHidden, "IsHidden"},
    {Property::FormatString, "FormatString"},
    {Property::DataType, "DataType"},
    {Property::SourceColumn, "SourceColumn"},
    {Property::IsActive, "IsActive"},
    {Property::ModelPermission, "ModelPermission"},
    {Property::Value, "Value"},
    {Property::ErrorMessage, "ErrorMessage"},
}};

} // anonymous namespace

bool IsFormulaBearing(const Node& node) {
    return std::visit([](const auto& data) {
        using T = std::decay_t<decltype(data)>;
        return HasExpression<T>::value;
    }, node.data);
}

const std::string* ExpressionOf(const Node& node) {
    return std::visit([](const auto& data) -> const std::string* {
        using T = std::decay_t<decltype(data)>;
        if constexpr (HasExpression<T>::value) {
            return &data.expression;
        } else {
            return nullptr;
        }
    }, node.data);
}

std::string* MutableExpressionOf(Node& node) {
    return std::visit([](auto& data) -> std::string* {
        using T = std::decay_t<decltype(data)>;
        if constexpr (HasExpression<T>::value) {
            return &data.expression;
        } else {
            return nullptr;
        }
    }, node.data);
}

const char* KindName(NodeKind kind) {
    for (const auto& [k, name] : kKindNames) {
        if (k == kind) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<NodeKind> KindFromName(std::string_view name) {
    for (const auto& [k, kind_name] : kKindNames) {
        if (NamesEqual(name, kind_name)) {
            return k;
        }
    }
    return std::nullopt;
}

NodeKind NameFamily(NodeKind kind) {
    return kind == NodeKind::CalculatedColumn ? NodeKind::DataColumn : kind;
}

bool IsColumnKind(NodeKind kind) {
    return kind == NodeKind::DataColumn || kind == NodeKind::CalculatedColumn;
}

const char* PropertyName(Property property) {
    for (const auto& [p, name] : kPropertyNames) {
        if (p == property) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<Property> PropertyFromName(std::string_view name) {
    for (const auto& [p, property_name] : kPropertyNames) {
        if (NamesEqual(name, property_name)) {
            return p;
        }
    }
    return std::nullopt;
}

std::string FormatPropertyValue(const PropertyValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return "\"" + *s + "\"";
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    return std::get<ObjectId>(value).ToString();
}

} // namespace tabedit
