#pragma once

#include <tabedit/core/result.hpp>
#include <tabedit/session/model_session.hpp>

#include <string_view>

namespace tabedit {

// ---------------------------------------------------------------------------
// Model fixtures.
//
//   name: Contoso
//   tables:
//     - name: Sales
//       columns:
//         - { name: Amount, data_type: Double, source_column: amount }
//         - { name: Margin, expression: "[Amount] * 0.2" }
//       measures:
//         - { name: Total Sales, expression: "SUM(Sales[Amount])", format_string: "#,0" }
//       hierarchies: [ { name: Calendar } ]
//       annotations: [ { name: Owner, value: Finance } ]
//   relationships:
//     - { from: Sales/CustomerKey, to: Customer/CustomerKey, active: true }
//   roles: [ { name: Readers, permission: Read } ]
//   perspectives: [ { name: Finance } ]
//
// The document is replayed through the session as one batch. On failure the
// partial load is undone, so the model is left as it was. The history is
// cleared either way.
// ---------------------------------------------------------------------------
Result<void, Error> LoadModelFromString(ModelSession& session, std::string_view yaml);
Result<void, Error> LoadModelFromFile(ModelSession& session, std::string_view file_path);

} // namespace tabedit
