#pragma once

#include <tabedit/model/node.hpp>

#include <string>
#include <variant>
#include <vector>

namespace tabedit {

// -- Primitive mutations ----------------------------------------------------

struct PropertySetAction {
    ObjectId target;
    Property property = Property::Name;
    PropertyValue old_value;
    PropertyValue new_value;

    bool operator==(const PropertySetAction& o) const {
        return target == o.target && property == o.property &&
               old_value == o.old_value && new_value == o.new_value;
    }
};

// The full node, parent included, as it was inserted.
struct AddNodeAction {
    Node node;

    bool operator==(const AddNodeAction& o) const { return node == o.node; }
};

// The full node, parent included, as it was before removal.
struct RemoveNodeAction {
    Node node;

    bool operator==(const RemoveNodeAction& o) const { return node == o.node; }
};

using Action = std::variant<PropertySetAction, AddNodeAction, RemoveNodeAction>;

// One-line human-readable rendering, used in logs and history views.
[[nodiscard]] std::string DescribeAction(const Action& action);

// ---------------------------------------------------------------------------
// Transaction — unit of undo granularity.
// ---------------------------------------------------------------------------
struct Transaction {
    std::string label;
    std::vector<Action> actions;
};

// ---------------------------------------------------------------------------
// IActionTarget — applies recorded actions during undo and redo.
//
// Implementations throw std::logic_error when an action does not match the
// current state (the old value is not current, the node is already present
// or already missing).
// ---------------------------------------------------------------------------
class IActionTarget {
public:
    virtual ~IActionTarget() = default;

    virtual void ApplyForward(const Action& action) = 0;
    virtual void ApplyInverse(const Action& action) = 0;
};

} // namespace tabedit
