#include <catch2/catch_test_macros.hpp>

#include <tabedit/formula/dax_tokenizer.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace tabedit;

namespace {

struct Lexeme {
    std::string text;
    TokenKind kind;

    bool operator==(const Lexeme& o) const { return text == o.text && kind == o.kind; }
};

std::vector<Lexeme> Lex(std::string_view text) {
    DaxTokenizer tokenizer;
    auto tokens = tokenizer.Tokenize(text);
    REQUIRE(tokens.IsOk());
    std::vector<Lexeme> out;
    for (const auto& t : tokens.Value()) {
        out.push_back({std::string(t.span.Of(text)), t.kind});
    }
    return out;
}

} // anonymous namespace

// ===========================================================================
// Token classes
// ===========================================================================

TEST_CASE("DaxTokenizer: empty and whitespace-only text", "[formula][tokenizer]") {
    CHECK(Lex("").empty());
    CHECK(Lex(" \t\r\n ").empty());
}

TEST_CASE("DaxTokenizer: function call with bracketed reference", "[formula][tokenizer]") {
    auto lex = Lex("SUM([Amount])");
    REQUIRE(lex.size() == 4);
    CHECK(lex[0] == Lexeme{"SUM", TokenKind::Identifier});
    CHECK(lex[1] == Lexeme{"(", TokenKind::Other});
    CHECK(lex[2] == Lexeme{"[Amount]", TokenKind::BracketedReference});
    CHECK(lex[3] == Lexeme{")", TokenKind::Other});
}

TEST_CASE("DaxTokenizer: qualified references", "[formula][tokenizer]") {
    auto plain = Lex("Sales[Amount]");
    REQUIRE(plain.size() == 2);
    CHECK(plain[0] == Lexeme{"Sales", TokenKind::Identifier});
    CHECK(plain[1] == Lexeme{"[Amount]", TokenKind::BracketedReference});

    auto quoted = Lex("'Sales Table'[Net Amount]");
    REQUIRE(quoted.size() == 2);
    CHECK(quoted[0] == Lexeme{"'Sales Table'", TokenKind::QuotedQualifiedReference});
    CHECK(quoted[1] == Lexeme{"[Net Amount]", TokenKind::BracketedReference});
}

TEST_CASE("DaxTokenizer: doubled closing delimiters stay inside the token", "[formula][tokenizer]") {
    auto lex = Lex("'Bob''s'[a]]b] & \"say \"\"hi\"\"\"");
    REQUIRE(lex.size() == 4);
    CHECK(lex[0] == Lexeme{"'Bob''s'", TokenKind::QuotedQualifiedReference});
    CHECK(lex[1] == Lexeme{"[a]]b]", TokenKind::BracketedReference});
    CHECK(lex[2] == Lexeme{"&", TokenKind::Other});
    CHECK(lex[3] == Lexeme{"\"say \"\"hi\"\"\"", TokenKind::StringLiteral});
}

TEST_CASE("DaxTokenizer: brackets inside a string literal are not references", "[formula][tokenizer]") {
    auto lex = Lex("\"[Amount]\" & [Amount]");
    REQUIRE(lex.size() == 3);
    CHECK(lex[0].kind == TokenKind::StringLiteral);
    CHECK(lex[2] == Lexeme{"[Amount]", TokenKind::BracketedReference});
}

TEST_CASE("DaxTokenizer: comments", "[formula][tokenizer]") {
    auto lex = Lex("[A] // trailing [B]\n+ [C] -- dash\n/* block [D] */ [E]");
    REQUIRE(lex.size() == 7);
    CHECK(lex[0] == Lexeme{"[A]", TokenKind::BracketedReference});
    CHECK(lex[1] == Lexeme{"// trailing [B]", TokenKind::Comment});
    CHECK(lex[2] == Lexeme{"+", TokenKind::Other});
    CHECK(lex[3] == Lexeme{"[C]", TokenKind::BracketedReference});
    CHECK(lex[4] == Lexeme{"-- dash", TokenKind::Comment});
    CHECK(lex[5] == Lexeme{"/* block [D] */", TokenKind::Comment});
    CHECK(lex[6] == Lexeme{"[E]", TokenKind::BracketedReference});
}

TEST_CASE("DaxTokenizer: numbers and operators", "[formula][tokenizer]") {
    auto lex = Lex("[Amount]*1.25>=.5");
    REQUIRE(lex.size() == 6);
    CHECK(lex[1] == Lexeme{"*", TokenKind::Other});
    CHECK(lex[2] == Lexeme{"1.25", TokenKind::Other});
    CHECK(lex[3] == Lexeme{">", TokenKind::Other});
    CHECK(lex[4] == Lexeme{"=", TokenKind::Other});
    CHECK(lex[5] == Lexeme{".5", TokenKind::Other});
}

TEST_CASE("DaxTokenizer: spans cover the source text", "[formula][tokenizer]") {
    DaxTokenizer tokenizer;
    std::string text = "CALCULATE ( [Total], 'Date'[Year] = 2024 )";
    auto tokens = tokenizer.Tokenize(text);
    REQUIRE(tokens.IsOk());
    std::size_t previous_end = 0;
    for (const auto& t : tokens.Value()) {
        CHECK(t.span.start >= previous_end);
        CHECK(t.span.end <= text.size());
        CHECK(t.span.Length() > 0);
        previous_end = t.span.end;
    }
    CHECK(tokens.Value()[2].span == Span{12, 19});
}

// ===========================================================================
// Malformed input
// ===========================================================================

TEST_CASE("DaxTokenizer: unterminated constructs are parse errors", "[formula][tokenizer]") {
    DaxTokenizer tokenizer;

    SECTION("bracket") {
        auto r = tokenizer.Tokenize("SUM([Amount)");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::ParseError);
        CHECK(r.Error().message == "Unterminated bracketed reference starting at offset 4");
    }
    SECTION("string") {
        auto r = tokenizer.Tokenize("\"open");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("string literal") != std::string::npos);
    }
    SECTION("quoted name") {
        CHECK(tokenizer.Tokenize("'Sales[Amount]").IsErr());
    }
    SECTION("block comment") {
        CHECK(tokenizer.Tokenize("[A] /* never closed").IsErr());
    }
    SECTION("escaped close at end of text") {
        CHECK(tokenizer.Tokenize("[abc]]").IsErr());
    }
}

TEST_CASE("TokenKindName", "[formula][tokenizer]") {
    CHECK(std::string(TokenKindName(TokenKind::BracketedReference)) == "BracketedReference");
    CHECK(std::string(TokenKindName(TokenKind::Comment)) == "Comment");
}
