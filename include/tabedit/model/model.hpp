#pragma once

#include <tabedit/core/result.hpp>
#include <tabedit/core/types.hpp>
#include <tabedit/model/node.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

// ---------------------------------------------------------------------------
// Model — the object graph and its authoritative property storage.
//
// Every mutation validates first and returns a typed Error without touching
// state when the value is illegal. The model does not record undo history and
// does not notify anyone; ModelSession layers both around these primitives.
//
// Children are ordered by id, so removing and re-inserting a node restores
// its position exactly.
// ---------------------------------------------------------------------------
class Model {
public:
    explicit Model(std::string name = "Model");

    [[nodiscard]] ObjectId Root() const noexcept { return ObjectId(1); }

    // -- Lookup -------------------------------------------------------------

    [[nodiscard]] const Node* Find(ObjectId id) const;
    [[nodiscard]] bool Contains(ObjectId id) const { return nodes_.count(id) > 0; }
    [[nodiscard]] std::size_t Size() const noexcept { return nodes_.size(); }

    [[nodiscard]] std::vector<ObjectId> Children(ObjectId parent) const;
    [[nodiscard]] std::vector<ObjectId> ChildrenOfKind(ObjectId parent, NodeKind kind) const;
    [[nodiscard]] std::vector<ObjectId> NodesOfKind(NodeKind kind) const;

    // Node and all its descendants, parents before children.
    [[nodiscard]] std::vector<ObjectId> Subtree(ObjectId id) const;

    [[nodiscard]] std::optional<ObjectId> FindTable(std::string_view name) const;
    [[nodiscard]] std::optional<ObjectId> FindChild(ObjectId parent, std::string_view name) const;
    [[nodiscard]] std::optional<ObjectId> FindColumn(ObjectId table, std::string_view name) const;
    [[nodiscard]] std::optional<ObjectId> FindMeasure(std::string_view name) const;
    [[nodiscard]] std::optional<ObjectId> FindMeasureInTable(ObjectId table, std::string_view name) const;

    // "Sales", "Sales/Amount", "Sales/Amount/Owner" (annotation). Names are
    // matched case-insensitively.
    [[nodiscard]] std::optional<ObjectId> FindByPath(std::string_view path) const;
    [[nodiscard]] std::string PathOf(ObjectId id) const;

    // Owning table of a column, measure, hierarchy or table annotation.
    [[nodiscard]] std::optional<ObjectId> TableOf(ObjectId id) const;

    // -- Validation ---------------------------------------------------------

    // `self` is the node being renamed, or an invalid id for a new node.
    [[nodiscard]] Result<void, Error> ValidateName(ObjectId self, NodeKind kind,
                                                   ObjectId parent,
                                                   std::string_view name) const;

    [[nodiscard]] Result<void, Error> ValidatePlacement(NodeKind kind, ObjectId parent,
                                                        ErrorCategory category) const;

    [[nodiscard]] Result<void, Error> ValidateNode(const Node& node) const;

    [[nodiscard]] Result<void, Error> ValidateProperty(ObjectId id, Property property,
                                                       const PropertyValue& value) const;

    // -- Storage ------------------------------------------------------------

    [[nodiscard]] ObjectId AllocateId();

    [[nodiscard]] Result<PropertyValue, Error> GetProperty(ObjectId id, Property property) const;

    // Stores `value` and returns the previous value.
    [[nodiscard]] Result<PropertyValue, Error> SetProperty(ObjectId id, Property property,
                                                           const PropertyValue& value);

    [[nodiscard]] Result<void, Error> Insert(Node node);

    // Removes a leaf node and returns it. Nodes with children are rejected.
    [[nodiscard]] Result<Node, Error> Erase(ObjectId id);

    bool operator==(const Model& other) const { return nodes_ == other.nodes_; }
    bool operator!=(const Model& other) const { return !(*this == other); }

private:
    Node* FindMutable(ObjectId id);
    [[nodiscard]] Error MakeError(const std::string& operation, ObjectId id,
                                  const std::string& message,
                                  ErrorCategory category) const;

    std::map<ObjectId, Node> nodes_;
    std::map<ObjectId, std::set<ObjectId>> children_;
    std::uint64_t next_id_ = 2;
};

// Allowed values for DataType and ModelPermission.
[[nodiscard]] bool IsKnownDataType(std::string_view data_type);
[[nodiscard]] bool IsKnownModelPermission(std::string_view permission);

} // namespace tabedit
