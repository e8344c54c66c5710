#include <tabedit/formula/dax_tokenizer.hpp>

#include <string>
#include <utility>

namespace tabedit {

namespace {

bool IsIdentStart(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentPart(char c) {
    return IsIdentStart(c) || (c >= '0' && c <= '9');
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

bool IsWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

Error Unterminated(const char* what, std::size_t offset) {
    return Error{"Tokenize", "",
                 std::string("Unterminated ") + what + " starting at offset " +
                     std::to_string(offset),
                 ErrorCategory::ParseError};
}

// Scans a delimited construct whose closing delimiter is escaped by doubling
// it. Returns the offset one past the closing delimiter, or npos.
std::size_t ScanDoubled(std::string_view text, std::size_t open, char close) {
    std::size_t i = open + 1;
    while (i < text.size()) {
        if (text[i] == close) {
            if (i + 1 < text.size() && text[i + 1] == close) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return std::string_view::npos;
}

} // anonymous namespace

const char* TokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::Identifier:               return "Identifier";
        case TokenKind::BracketedReference:       return "BracketedReference";
        case TokenKind::QuotedQualifiedReference: return "QuotedQualifiedReference";
        case TokenKind::StringLiteral:            return "StringLiteral";
        case TokenKind::Comment:                  return "Comment";
        case TokenKind::Other:                    return "Other";
    }
    return "Unknown";
}

Result<std::vector<Token>, Error> DaxTokenizer::Tokenize(std::string_view text) const {
    using R = Result<std::vector<Token>, Error>;
    std::vector<Token> tokens;
    std::size_t i = 0;

    auto emit = [&](std::size_t start, std::size_t end, TokenKind kind) {
        tokens.push_back(Token{Span{start, end}, kind});
        i = end;
    };

    while (i < text.size()) {
        const char c = text[i];
        const char next = i + 1 < text.size() ? text[i + 1] : '\0';

        if (IsWhitespace(c)) {
            ++i;
            continue;
        }

        if ((c == '/' && next == '/') || (c == '-' && next == '-')) {
            auto eol = text.find('\n', i);
            emit(i, eol == std::string_view::npos ? text.size() : eol, TokenKind::Comment);
            continue;
        }

        if (c == '/' && next == '*') {
            auto close = text.find("*/", i + 2);
            if (close == std::string_view::npos) {
                return R::Err(Unterminated("block comment", i));
            }
            emit(i, close + 2, TokenKind::Comment);
            continue;
        }

        if (c == '"') {
            auto end = ScanDoubled(text, i, '"');
            if (end == std::string_view::npos) {
                return R::Err(Unterminated("string literal", i));
            }
            emit(i, end, TokenKind::StringLiteral);
            continue;
        }

        if (c == '[') {
            auto end = ScanDoubled(text, i, ']');
            if (end == std::string_view::npos) {
                return R::Err(Unterminated("bracketed reference", i));
            }
            emit(i, end, TokenKind::BracketedReference);
            continue;
        }

        if (c == '\'') {
            auto end = ScanDoubled(text, i, '\'');
            if (end == std::string_view::npos) {
                return R::Err(Unterminated("quoted name", i));
            }
            emit(i, end, TokenKind::QuotedQualifiedReference);
            continue;
        }

        if (IsIdentStart(c)) {
            std::size_t end = i + 1;
            while (end < text.size() && IsIdentPart(text[end])) {
                ++end;
            }
            emit(i, end, TokenKind::Identifier);
            continue;
        }

        if (IsDigit(c) || (c == '.' && IsDigit(next))) {
            std::size_t end = i + 1;
            while (end < text.size() && (IsDigit(text[end]) || text[end] == '.')) {
                ++end;
            }
            emit(i, end, TokenKind::Other);
            continue;
        }

        emit(i, i + 1, TokenKind::Other);
    }
    return R::Ok(std::move(tokens));
}

} // namespace tabedit
