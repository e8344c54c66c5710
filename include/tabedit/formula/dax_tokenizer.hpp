#pragma once

#include <tabedit/formula/tokenizer.hpp>

namespace tabedit {

// ---------------------------------------------------------------------------
// DaxTokenizer — default tokenizer for DAX-flavoured formula text.
//
//   "..."   string literal, "" escapes a quote
//   [...]   bracketed reference, ]] escapes a bracket
//   '...'   quoted name, '' escapes a quote
//   // --   line comments
//   /* */   block comment
// ---------------------------------------------------------------------------
class DaxTokenizer : public ITokenizer {
public:
    [[nodiscard]] Result<std::vector<Token>, Error> Tokenize(
        std::string_view text) const override;
};

} // namespace tabedit
