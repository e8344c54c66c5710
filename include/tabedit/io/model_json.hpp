#pragma once

#include <tabedit/session/model_session.hpp>

#include <nlohmann/json.hpp>

namespace tabedit {

// JSON views used by `--json` output.

[[nodiscard]] nlohmann::json NodeToJson(const Model& model, const Node& node);

// {"name": ..., "objects": [...]} in tree order, root excluded.
[[nodiscard]] nlohmann::json ModelToJson(const Model& model);

// Dependents, dependencies and index diagnostics of one object.
[[nodiscard]] nlohmann::json DependenciesToJson(const ModelSession& session, ObjectId id);

// {"undo": [...], "redo": [...]}, most recent first.
[[nodiscard]] nlohmann::json HistoryToJson(const UndoManager& history);

[[nodiscard]] nlohmann::json FixupReportToJson(const Model& model, const FixupReport& report);

} // namespace tabedit
