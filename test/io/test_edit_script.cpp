#include <catch2/catch_test_macros.hpp>

#include <tabedit/formula/dax_tokenizer.hpp>
#include <tabedit/io/edit_script.hpp>
#include <tabedit/io/model_loader.hpp>

#include <set>
#include <string>

using namespace tabedit;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/io
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

struct LoadedModel {
    LoadedModel() : session(tokenizer) {
        auto loaded = LoadModelFromFile(session, TestDataPath("contoso.yaml"));
        REQUIRE(loaded.IsOk());
    }

    std::string Expr(const std::string& path) const {
        auto id = session.Find(path);
        REQUIRE(id.has_value());
        return *ExpressionOf(*session.GetModel().Find(*id));
    }

    DaxTokenizer tokenizer;
    ModelSession session;
};

} // anonymous namespace

// ===========================================================================
// Parsing
// ===========================================================================

TEST_CASE("ParseEditScript: steps mapping", "[io][script]") {
    auto r = ParseEditScript(R"yaml(
steps:
  - { op: rename, path: Sales/Amount, name: Revenue }
  - { op: move, path: Sales/Profit, table: Customer }
  - { op: add_measure, table: Sales, name: Count, expression: "COUNTROWS(Sales)" }
  - { op: begin_batch }
  - { op: end_batch }
)yaml");
    REQUIRE(r.IsOk());
    const auto& steps = r.Value();
    REQUIRE(steps.size() == 5);
    CHECK(steps[0].kind == StepKind::Rename);
    CHECK(steps[0].path == "Sales/Amount");
    CHECK(steps[0].name == "Revenue");
    CHECK(steps[1].kind == StepKind::Move);
    CHECK(steps[1].table == "Customer");
    CHECK(steps[2].kind == StepKind::AddMeasure);
    CHECK(steps[2].expression == "COUNTROWS(Sales)");
    CHECK(steps[3].label == "Script batch");
}

TEST_CASE("ParseEditScript: bare step list", "[io][script]") {
    auto r = ParseEditScript(R"(
- { op: set_expression, path: Sales/Profit, expression: "[Total Sales]" }
- { op: undo }
- { op: redo }
- { op: remove, path: Sales/Profit }
)");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == 4);
    CHECK(r.Value()[0].expression == "[Total Sales]");
    CHECK(r.Value()[1].kind == StepKind::Undo);
    CHECK(r.Value()[2].kind == StepKind::Redo);
    CHECK(r.Value()[3].kind == StepKind::Remove);
}

TEST_CASE("ParseEditScript: malformed scripts", "[io][script]") {
    SECTION("unknown op") {
        auto r = ParseEditScript("steps:\n  - { op: explode }\n");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::ParseError);
        CHECK(r.Error().message == "Step 1 has unknown op 'explode'");
    }
    SECTION("missing field") {
        auto r = ParseEditScript("steps:\n  - { op: undo }\n  - { op: rename, path: Sales }\n");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Step 2 (rename) missing 'name' field");
    }
    SECTION("missing op") {
        auto r = ParseEditScript("steps:\n  - { path: Sales }\n");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Step 1 missing 'op' field");
    }
    SECTION("no steps") {
        auto r = ParseEditScript("name: nothing\n");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Edit script must contain a 'steps' list");
    }
    SECTION("invalid YAML") {
        auto r = ParseEditScript("steps: [ { op: undo ");
        REQUIRE(r.IsErr());
        CHECK(r.Error().operation == "EditScript");
    }
}

TEST_CASE("LoadEditScript: reads a script file", "[io][script]") {
    auto r = LoadEditScript(TestDataPath("rename_script.yaml"));
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().size() == 6);
    CHECK(r.Value()[1].label == "Restructure");

    auto missing = LoadEditScript(TestDataPath("no_such_script.yaml"));
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().category == ErrorCategory::ParseError);
}

TEST_CASE("StepKindName: script spelling", "[io][script]") {
    CHECK(std::string(StepKindName(StepKind::SetExpression)) == "set_expression");
    CHECK(std::string(StepKindName(StepKind::BeginBatch)) == "begin_batch");
}

// ===========================================================================
// Running
// ===========================================================================

TEST_CASE("RunEditScript: applies the sample script", "[io][script]") {
    LoadedModel m;
    auto steps = LoadEditScript(TestDataPath("rename_script.yaml"));
    REQUIRE(steps.IsOk());

    auto r = RunEditScript(m.session, steps.Value());
    REQUIRE(r.IsOk());
    CHECK(r.Value().applied == 6);
    CHECK(r.Value().log.front() == "rename Sales/Total Sales -> Revenue");

    CHECK_FALSE(m.session.Find("Sales/Total Sales").has_value());
    CHECK(m.Expr("Customer/Profit") == "[Revenue] - [Total Cost] * 1.1");
    CHECK(m.Expr("Sales/Margin Pct") == "DIVIDE([Profit], [Revenue])");

    const auto& history = m.session.History();
    REQUIRE(history.UndoDepth() == 3);
    CHECK(history.UndoLabels()[1] == "Restructure");
    CHECK(history.UndoLabels()[2] == "Rename Sales/Total Sales to Revenue");
}

TEST_CASE("RunEditScript: a rename step rewrites dependents", "[io][script]") {
    LoadedModel m;
    auto steps = ParseEditScript("- { op: rename, path: Sales/Amount, name: Net Amount }\n");
    REQUIRE(steps.IsOk());
    REQUIRE(RunEditScript(m.session, steps.Value()).IsOk());
    CHECK(m.Expr("Sales/Total Sales") == "SUM(Sales[Net Amount])");
    CHECK(m.Expr("Sales/Margin") == "[Net Amount] - [Cost]");
}

TEST_CASE("RunEditScript: undo and redo steps", "[io][script]") {
    LoadedModel m;
    const Model original = m.session.GetModel();
    auto steps = ParseEditScript(R"(
- { op: rename, path: Sales/Total Cost, name: Spend }
- { op: undo }
- { op: undo }
)");
    REQUIRE(steps.IsOk());

    auto r = RunEditScript(m.session, steps.Value());
    REQUIRE(r.IsOk());
    CHECK(r.Value().log[1] == "undo");
    CHECK(r.Value().log[2] == "undo (nothing to undo)");
    CHECK(m.session.GetModel() == original);

    auto redo = ParseEditScript("- { op: redo }\n");
    REQUIRE(RunEditScript(m.session, redo.Value()).IsOk());
    CHECK(m.Expr("Sales/Profit") == "[Total Sales] - [Spend]");
}

TEST_CASE("RunEditScript: stops at the first failing step", "[io][script]") {
    LoadedModel m;
    auto steps = ParseEditScript(R"(
- { op: rename, path: Sales/Cost, name: Expense }
- { op: rename, path: Sales/Nope, name: Other }
- { op: rename, path: Sales/Amount, name: Gross }
)");
    REQUIRE(steps.IsOk());

    auto r = RunEditScript(m.session, steps.Value());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NotFound);
    CHECK(r.Error().target == "Sales/Nope");
    CHECK(m.session.Find("Sales/Expense").has_value());
    CHECK(m.session.Find("Sales/Amount").has_value());
}

TEST_CASE("RunEditScript: batches", "[io][script]") {
    LoadedModel m;

    SECTION("undo inside an open batch is rejected and the batch is closed") {
        auto steps = ParseEditScript(R"(
- { op: begin_batch, label: Pending }
- { op: rename, path: Sales/Cost, name: Expense }
- { op: undo }
)");
        auto r = RunEditScript(m.session, steps.Value());
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::InvalidValue);
        CHECK(m.session.History().BatchDepth() == 0);
        CHECK(m.session.History().UndoLabels()[0] == "Pending");
    }
    SECTION("end_batch without begin_batch") {
        auto steps = ParseEditScript("- { op: end_batch }\n");
        auto r = RunEditScript(m.session, steps.Value());
        REQUIRE(r.IsErr());
        CHECK(r.Error().operation == "EndBatch");
    }
    SECTION("a batch left open is closed at the end") {
        auto steps = ParseEditScript(R"(
- { op: begin_batch, label: Open }
- { op: rename, path: Sales/Cost, name: Expense }
- { op: rename, path: Sales/Amount, name: Gross }
)");
        auto r = RunEditScript(m.session, steps.Value());
        REQUIRE(r.IsOk());
        CHECK(m.session.History().BatchDepth() == 0);
        CHECK(m.session.History().UndoDepth() == 1);
        REQUIRE(m.session.Undo());
        CHECK(m.Expr("Sales/Margin") == "[Amount] - [Cost]");
    }
}
