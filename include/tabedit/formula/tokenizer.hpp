#pragma once

#include <tabedit/core/result.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace tabedit {

// Half-open [start, end) byte range into an expression.
struct Span {
    std::size_t start = 0;
    std::size_t end = 0;

    [[nodiscard]] std::size_t Length() const noexcept { return end - start; }
    [[nodiscard]] std::string_view Of(std::string_view text) const {
        return text.substr(start, end - start);
    }

    bool operator==(const Span& o) const { return start == o.start && end == o.end; }
    bool operator!=(const Span& o) const { return !(*this == o); }
};

enum class TokenKind {
    Identifier,                // Sales, SUM, VAR
    BracketedReference,        // [Amount]
    QuotedQualifiedReference,  // 'Sales Table'
    StringLiteral,             // "text"
    Comment,                   // // ..., -- ..., /* ... */
    Other,                     // operators, numbers, punctuation
};

[[nodiscard]] const char* TokenKindName(TokenKind kind);

struct Token {
    Span span;
    TokenKind kind = TokenKind::Other;

    bool operator==(const Token& o) const { return span == o.span && kind == o.kind; }
};

// ---------------------------------------------------------------------------
// ITokenizer — splits formula text into classified tokens.
//
// Whitespace is not emitted. Tokens are returned in text order and do not
// overlap. A malformed text (unterminated literal, bracket or comment) yields
// an Error with category ParseError.
// ---------------------------------------------------------------------------
class ITokenizer {
public:
    virtual ~ITokenizer() = default;

    [[nodiscard]] virtual Result<std::vector<Token>, Error> Tokenize(
        std::string_view text) const = 0;
};

} // namespace tabedit
