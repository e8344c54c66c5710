#pragma once

#include <string>
#include <string_view>

namespace tabedit {

// Canonical reference text for names appearing in formulas.
//
//   QuoteMember("Net ]Sales")  ->  [Net ]]Sales]
//   QuoteTable("Bob's")        ->  'Bob''s'

[[nodiscard]] std::string QuoteMember(std::string_view name);
[[nodiscard]] std::string QuoteTable(std::string_view name);

// [A-Za-z_][A-Za-z0-9_]*; such names may appear unquoted as table qualifiers.
[[nodiscard]] bool IsPlainIdentifier(std::string_view name);

// Inverse of QuoteMember/QuoteTable. The input must be a complete
// BracketedReference or QuotedQualifiedReference token.
[[nodiscard]] std::string UnquoteMember(std::string_view token);
[[nodiscard]] std::string UnquoteTable(std::string_view token);

} // namespace tabedit
