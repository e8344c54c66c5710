#pragma once

#include <tabedit/core/result.hpp>
#include <tabedit/session/model_session.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tabedit {

enum class StepKind {
    Rename,
    Move,
    SetExpression,
    AddMeasure,
    Remove,
    Undo,
    Redo,
    BeginBatch,
    EndBatch,
};

[[nodiscard]] const char* StepKindName(StepKind kind);

// One scripted edit. Unused fields are empty.
struct EditStep {
    StepKind kind = StepKind::Undo;
    std::string path;        // object to edit
    std::string name;        // rename target / new measure name
    std::string table;       // move destination / add_measure owner
    std::string expression;  // set_expression / add_measure
    std::string label;       // begin_batch
};

// ---------------------------------------------------------------------------
// Edit scripts.
//
//   steps:
//     - { op: rename, path: Sales/Total, name: Revenue }
//     - { op: move, path: Sales/Revenue, table: Finance }
//     - { op: set_expression, path: Sales/Margin, expression: "[Amount] * 0.3" }
//     - { op: add_measure, table: Sales, name: Count, expression: "COUNTROWS(Sales)" }
//     - { op: remove, path: Sales/Count }
//     - { op: begin_batch, label: "Tidy up" }
//     - { op: end_batch }
//     - { op: undo }
//     - { op: redo }
// ---------------------------------------------------------------------------
Result<std::vector<EditStep>, Error> ParseEditScript(std::string_view yaml);
Result<std::vector<EditStep>, Error> LoadEditScript(std::string_view file_path);

struct ScriptResult {
    std::size_t applied = 0;
    std::vector<std::string> log;  // one line per applied step
};

// Applies steps in order and stops at the first failing step. Batches the
// script opened are closed before returning.
Result<ScriptResult, Error> RunEditScript(ModelSession& session,
                                          const std::vector<EditStep>& steps);

} // namespace tabedit
