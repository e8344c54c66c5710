#include <tabedit/undo/action.hpp>

namespace tabedit {

namespace {

std::string NodeLabel(const Node& node) {
    return std::string(KindName(node.Kind())) + " '" + node.name + "' " + node.id.ToString();
}

} // anonymous namespace

std::string DescribeAction(const Action& action) {
    if (const auto* set = std::get_if<PropertySetAction>(&action)) {
        return std::string("Set ") + PropertyName(set->property) + " of " +
               set->target.ToString() + ": " + FormatPropertyValue(set->old_value) +
               " -> " + FormatPropertyValue(set->new_value);
    }
    if (const auto* add = std::get_if<AddNodeAction>(&action)) {
        return "Add " + NodeLabel(add->node) + " under " + add->node.parent.ToString();
    }
    const auto& remove = std::get<RemoveNodeAction>(action);
    return "Remove " + NodeLabel(remove.node) + " from " + remove.node.parent.ToString();
}

} // namespace tabedit
