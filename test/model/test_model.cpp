#include <catch2/catch_test_macros.hpp>

#include <tabedit/model/model.hpp>

#include <string>
#include <vector>

using namespace tabedit;

namespace {

ObjectId Add(Model& model, ObjectId parent, std::string name, NodeData data) {
    Node node;
    node.id = model.AllocateId();
    node.parent = parent;
    node.name = std::move(name);
    node.data = std::move(data);
    auto id = node.id;
    auto inserted = model.Insert(std::move(node));
    REQUIRE(inserted.IsOk());
    return id;
}

// Sales(Amount, Cost, [Total Sales]) and Product(Key, Color).
struct SalesModel {
    Model model;
    ObjectId sales, amount, cost, total;
    ObjectId product, key, color;

    SalesModel() {
        sales = Add(model, model.Root(), "Sales", TableData{});
        amount = Add(model, sales, "Amount", DataColumnData{"Decimal", "amount"});
        cost = Add(model, sales, "Cost", DataColumnData{"Decimal", "cost"});
        total = Add(model, sales, "Total Sales", MeasureData{"SUM([Amount])", ""});
        product = Add(model, model.Root(), "Product", TableData{});
        key = Add(model, product, "Key", DataColumnData{"Int64", "id"});
        color = Add(model, product, "Color", DataColumnData{});
    }
};

} // anonymous namespace

// ===========================================================================
// Construction and lookup
// ===========================================================================

TEST_CASE("Model: new model has only the root", "[model]") {
    Model model("Contoso");
    CHECK(model.Size() == 1);
    REQUIRE(model.Find(model.Root()) != nullptr);
    CHECK(model.Find(model.Root())->name == "Contoso");
    CHECK(model.Find(model.Root())->Kind() == NodeKind::Model);
    CHECK(model.Children(model.Root()).empty());
}

TEST_CASE("Model: ids are allocated in increasing order", "[model]") {
    Model model;
    auto a = model.AllocateId();
    auto b = model.AllocateId();
    CHECK(a.Value() == 2);
    CHECK(a < b);
}

TEST_CASE("Model: FindByPath resolves nested names case-insensitively", "[model][path]") {
    SalesModel m;
    CHECK(m.model.FindByPath("Sales") == m.sales);
    CHECK(m.model.FindByPath("sales/AMOUNT") == m.amount);
    CHECK(m.model.FindByPath("Sales/Total Sales") == m.total);
    CHECK_FALSE(m.model.FindByPath("Sales/Missing").has_value());
    CHECK_FALSE(m.model.FindByPath("").has_value());
}

TEST_CASE("Model: FindByPath prefers a root child whose name contains a slash", "[model][path]") {
    SalesModel m;
    auto rel = Add(m.model, m.model.Root(), "Sales/Cost -> Product/Key",
                   RelationshipData{m.cost, m.key, true});
    CHECK(m.model.FindByPath("Sales/Cost -> Product/Key") == rel);
}

TEST_CASE("Model: PathOf joins names below the root", "[model][path]") {
    SalesModel m;
    CHECK(m.model.PathOf(m.total) == "Sales/Total Sales");
    CHECK(m.model.PathOf(m.product) == "Product");
    CHECK(m.model.PathOf(m.model.Root()) == "Model");
    CHECK(m.model.PathOf(ObjectId(999)) == "#999");
}

TEST_CASE("Model: Subtree lists parents before children by ascending id", "[model]") {
    SalesModel m;
    auto subtree = m.model.Subtree(m.sales);
    CHECK(subtree == std::vector<ObjectId>{m.sales, m.amount, m.cost, m.total});
    CHECK(m.model.Subtree(ObjectId(999)).empty());
}

TEST_CASE("Model: column and measure lookups", "[model]") {
    SalesModel m;
    CHECK(m.model.FindTable("PRODUCT") == m.product);
    CHECK(m.model.FindColumn(m.sales, "amount") == m.amount);
    CHECK_FALSE(m.model.FindColumn(m.sales, "Total Sales").has_value());
    CHECK(m.model.FindMeasure("total sales") == m.total);
    CHECK(m.model.FindMeasureInTable(m.sales, "Total Sales") == m.total);
    CHECK_FALSE(m.model.FindMeasureInTable(m.product, "Total Sales").has_value());
    CHECK(m.model.TableOf(m.total) == m.sales);
    CHECK_FALSE(m.model.TableOf(m.model.Root()).has_value());
    CHECK(m.model.NodesOfKind(NodeKind::Table) == std::vector<ObjectId>{m.sales, m.product});
    CHECK(m.model.ChildrenOfKind(m.sales, NodeKind::Measure) == std::vector<ObjectId>{m.total});
}

// ===========================================================================
// Validation
// ===========================================================================

TEST_CASE("Model: sibling names must be unique ignoring case", "[model][validate]") {
    SalesModel m;
    auto r = m.model.ValidateName(ObjectId(), NodeKind::DataColumn, m.sales, "AMOUNT");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NameConflict);
}

TEST_CASE("Model: calculated columns share the column namespace", "[model][validate]") {
    SalesModel m;
    auto r = m.model.ValidateName(ObjectId(), NodeKind::CalculatedColumn, m.sales, "Cost");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NameConflict);
}

TEST_CASE("Model: a hierarchy may reuse a column name", "[model][validate]") {
    SalesModel m;
    CHECK(m.model.ValidateName(ObjectId(), NodeKind::Hierarchy, m.sales, "Amount").IsOk());
}

TEST_CASE("Model: measure names are unique across tables", "[model][validate]") {
    SalesModel m;
    auto r = m.model.ValidateName(ObjectId(), NodeKind::Measure, m.product, "Total Sales");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NameConflict);
}

TEST_CASE("Model: measure and column of one table cannot share a name", "[model][validate]") {
    SalesModel m;
    CHECK(m.model.ValidateName(ObjectId(), NodeKind::Measure, m.sales, "Cost").IsErr());
    CHECK(m.model.ValidateName(ObjectId(), NodeKind::DataColumn, m.sales, "Total Sales").IsErr());
    CHECK(m.model.ValidateName(ObjectId(), NodeKind::Measure, m.product, "Cost").IsOk());
}

TEST_CASE("Model: renaming to the current name is not a conflict", "[model][validate]") {
    SalesModel m;
    CHECK(m.model.ValidateName(m.total, NodeKind::Measure, m.sales, "total sales").IsOk());
}

TEST_CASE("Model: illegal names are InvalidValue", "[model][validate]") {
    SalesModel m;
    auto r = m.model.ValidateName(ObjectId(), NodeKind::Table, m.model.Root(), " padded");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidValue);
}

TEST_CASE("Model: placement rules", "[model][validate]") {
    SalesModel m;
    auto root = m.model.Root();
    CHECK(m.model.ValidatePlacement(NodeKind::Table, root, ErrorCategory::InvalidValue).IsOk());
    CHECK(m.model.ValidatePlacement(NodeKind::Measure, m.sales, ErrorCategory::InvalidValue).IsOk());
    CHECK(m.model.ValidatePlacement(NodeKind::Annotation, m.amount, ErrorCategory::InvalidValue).IsOk());
    CHECK(m.model.ValidatePlacement(NodeKind::Measure, root, ErrorCategory::InvalidMove).IsErr());
    CHECK(m.model.ValidatePlacement(NodeKind::Table, m.sales, ErrorCategory::InvalidValue).IsErr());
    auto missing = m.model.ValidatePlacement(NodeKind::Measure, ObjectId(999), ErrorCategory::InvalidMove);
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().category == ErrorCategory::InvalidMove);
}

TEST_CASE("Model: Insert rejects unknown data types and permissions", "[model][validate]") {
    SalesModel m;
    Node column;
    column.id = m.model.AllocateId();
    column.parent = m.sales;
    column.name = "Weird";
    column.data = DataColumnData{"Float128", ""};
    auto r = m.model.Insert(column);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidValue);

    Node role;
    role.id = m.model.AllocateId();
    role.parent = m.model.Root();
    role.name = "Readers";
    role.data = RoleData{"Everything"};
    CHECK(m.model.Insert(role).IsErr());
}

TEST_CASE("Model: relationship endpoints must be columns of two tables", "[model][validate]") {
    SalesModel m;
    Node rel;
    rel.id = m.model.AllocateId();
    rel.parent = m.model.Root();
    rel.name = "Self";
    rel.data = RelationshipData{m.amount, m.cost, true};
    CHECK(m.model.Insert(rel).IsErr());

    rel.data = RelationshipData{m.amount, m.total, true};
    CHECK(m.model.Insert(rel).IsErr());

    rel.data = RelationshipData{m.cost, m.key, true};
    CHECK(m.model.Insert(rel).IsOk());
}

TEST_CASE("Model: Insert rejects a duplicate id", "[model][validate]") {
    SalesModel m;
    Node node;
    node.id = m.amount;
    node.parent = m.sales;
    node.name = "Other";
    node.data = DataColumnData{};
    auto r = m.model.Insert(node);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Internal);
}

// ===========================================================================
// Properties
// ===========================================================================

TEST_CASE("Model: SetProperty returns the previous value", "[model][property]") {
    SalesModel m;
    auto old = m.model.SetProperty(m.total, Property::Expression, std::string("SUM([Cost])"));
    REQUIRE(old.IsOk());
    CHECK(std::get<std::string>(old.Value()) == "SUM([Amount])");
    CHECK(*ExpressionOf(*m.model.Find(m.total)) == "SUM([Cost])");
}

TEST_CASE("Model: bool properties", "[model][property]") {
    SalesModel m;
    auto old = m.model.SetProperty(m.amount, Property::IsHidden, true);
    REQUIRE(old.IsOk());
    CHECK(std::get<bool>(old.Value()) == false);
    CHECK(m.model.Find(m.amount)->is_hidden);
}

TEST_CASE("Model: property must apply to the node kind", "[model][property]") {
    SalesModel m;
    auto r = m.model.SetProperty(m.amount, Property::Expression, std::string("1"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidValue);
    CHECK(m.model.GetProperty(m.sales, Property::FormatString).IsErr());
}

TEST_CASE("Model: property value type is checked", "[model][property]") {
    SalesModel m;
    auto r = m.model.SetProperty(m.amount, Property::IsHidden, std::string("yes"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidValue);
}

TEST_CASE("Model: missing node is NotFound", "[model][property]") {
    Model model;
    auto r = model.SetProperty(ObjectId(42), Property::Name, std::string("X"));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NotFound);
}

TEST_CASE("Model: Parent moves a measure between tables", "[model][property]") {
    SalesModel m;
    auto old = m.model.SetProperty(m.total, Property::Parent, m.product);
    REQUIRE(old.IsOk());
    CHECK(std::get<ObjectId>(old.Value()) == m.sales);
    CHECK(m.model.Find(m.total)->parent == m.product);
    CHECK(m.model.ChildrenOfKind(m.sales, NodeKind::Measure).empty());
    CHECK(m.model.PathOf(m.total) == "Product/Total Sales");
}

TEST_CASE("Model: only measures move, and only to tables", "[model][property]") {
    SalesModel m;
    auto column = m.model.SetProperty(m.amount, Property::Parent, m.product);
    REQUIRE(column.IsErr());
    CHECK(column.Error().category == ErrorCategory::InvalidMove);

    auto to_root = m.model.SetProperty(m.total, Property::Parent, m.model.Root());
    REQUIRE(to_root.IsErr());
    CHECK(to_root.Error().category == ErrorCategory::InvalidMove);

    auto root = m.model.SetProperty(m.model.Root(), Property::Parent, m.sales);
    REQUIRE(root.IsErr());
    CHECK(root.Error().category == ErrorCategory::InvalidMove);
}

TEST_CASE("Model: moving onto a same-named column conflicts", "[model][property]") {
    SalesModel m;
    auto measure = Add(m.model, m.sales, "Color", MeasureData{"1", ""});
    auto r = m.model.SetProperty(measure, Property::Parent, m.product);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NameConflict);
    CHECK(m.model.Find(measure)->parent == m.sales);
}

TEST_CASE("Model: DataType and ModelPermission are checked on write", "[model][property]") {
    SalesModel m;
    CHECK(m.model.SetProperty(m.amount, Property::DataType, std::string("Int64")).IsOk());
    CHECK(m.model.SetProperty(m.amount, Property::DataType, std::string("Text")).IsErr());
}

// ===========================================================================
// Erase
// ===========================================================================

TEST_CASE("Model: Erase returns the removed leaf", "[model][erase]") {
    SalesModel m;
    auto removed = m.model.Erase(m.total);
    REQUIRE(removed.IsOk());
    CHECK(removed.Value().name == "Total Sales");
    CHECK_FALSE(m.model.Contains(m.total));
    CHECK(m.model.Children(m.sales) == std::vector<ObjectId>{m.amount, m.cost});
}

TEST_CASE("Model: Erase then Insert restores an equal model", "[model][erase]") {
    SalesModel m;
    Model before = m.model;
    auto removed = m.model.Erase(m.cost);
    REQUIRE(removed.IsOk());
    CHECK(m.model != before);
    REQUIRE(m.model.Insert(std::move(removed).Value()).IsOk());
    CHECK(m.model == before);
    CHECK(m.model.Children(m.sales) == before.Children(m.sales));
}

TEST_CASE("Model: Erase rejects root, missing and non-leaf nodes", "[model][erase]") {
    SalesModel m;
    auto root = m.model.Erase(m.model.Root());
    REQUIRE(root.IsErr());
    CHECK(root.Error().category == ErrorCategory::InvalidValue);

    auto missing = m.model.Erase(ObjectId(999));
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().category == ErrorCategory::NotFound);

    auto parent = m.model.Erase(m.sales);
    REQUIRE(parent.IsErr());
    CHECK(parent.Error().category == ErrorCategory::Internal);
}

// ===========================================================================
// Node helpers
// ===========================================================================

TEST_CASE("Node: formula-bearing kinds expose an expression", "[model][node]") {
    Node measure;
    measure.data = MeasureData{"1+1", ""};
    Node column;
    column.data = DataColumnData{};
    CHECK(IsFormulaBearing(measure));
    CHECK_FALSE(IsFormulaBearing(column));
    REQUIRE(ExpressionOf(measure) != nullptr);
    CHECK(*ExpressionOf(measure) == "1+1");
    CHECK(ExpressionOf(column) == nullptr);
}

TEST_CASE("Node: kind and property names round-trip", "[model][node]") {
    CHECK(std::string(KindName(NodeKind::CalculatedColumn)) == "CalculatedColumn");
    CHECK(KindFromName("measure") == NodeKind::Measure);
    CHECK_FALSE(KindFromName("Cube").has_value());
    CHECK(PropertyFromName("formatstring") == Property::FormatString);
    CHECK(std::string(PropertyName(Property::IsHidden)) == "IsHidden");
}

TEST_CASE("Node: FormatPropertyValue", "[model][node]") {
    CHECK(FormatPropertyValue(std::string("x")) == "\"x\"");
    CHECK(FormatPropertyValue(true) == "true");
    CHECK(FormatPropertyValue(ObjectId(4)) == "#4");
}
