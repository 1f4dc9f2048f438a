#include <catch2/catch.hpp>
#include <declscan/lang/lexer.hpp>
#include <string>

using namespace declscan;

// Rebuild the source from token offsets; every gap must lex to nothing.
static std::string rebuild(const std::string& src, const std::vector<Token>& toks) {
    std::string out;
    size_t cursor = 0;
    for (const auto& t : toks) {
        REQUIRE(t.pos.offset >= cursor);
        std::string gap = src.substr(cursor, t.pos.offset - cursor);
        CHECK(tokenize(gap).empty());
        out += gap;
        REQUIRE(src.compare(t.pos.offset, t.text.size(), t.text) == 0);
        out += t.text;
        cursor = t.pos.offset + t.text.size();
    }
    std::string tail = src.substr(cursor);
    CHECK(tokenize(tail).empty());
    out += tail;
    return out;
}

// ===== Basic tokenization =====

TEST_CASE("tokenize empty string", "[lexer]") {
    REQUIRE(tokenize("").empty());
}

TEST_CASE("tokenize whitespace only", "[lexer]") {
    REQUIRE(tokenize("  \t\r\n\n  \f\v").empty());
}

TEST_CASE("tokenize single identifier", "[lexer]") {
    auto toks = tokenize("foo");
    REQUIRE(toks.size() == 1);
    CHECK(toks[0].kind == TokenKind::Identifier);
    CHECK(toks[0].text == "foo");
    CHECK(toks[0].pos.line == 1);
    CHECK(toks[0].pos.col == 1);
    CHECK(toks[0].pos.offset == 0);
}

TEST_CASE("identifiers may contain digits and underscores", "[lexer]") {
    auto toks = tokenize("_tmp x1 __m128_t");
    REQUIRE(toks.size() == 3);
    CHECK(toks[0].text == "_tmp");
    CHECK(toks[1].text == "x1");
    CHECK(toks[2].text == "__m128_t");
    for (const auto& t : toks) CHECK(t.kind == TokenKind::Identifier);
}

TEST_CASE("keywords come from the reserved set", "[lexer]") {
    auto toks = tokenize("int static uint8_t class override return");
    REQUIRE(toks.size() == 6);
    for (const auto& t : toks) CHECK(t.kind == TokenKind::Keyword);
}

TEST_CASE("words outside the reserved set are identifiers", "[lexer]") {
    auto toks = tokenize("true nullptr size_t int32_t long");
    REQUIRE(toks.size() == 5);
    for (const auto& t : toks) CHECK(t.kind == TokenKind::Identifier);
}

TEST_CASE("keyword prefix does not make a keyword", "[lexer]") {
    auto toks = tokenize("integer constant");
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].kind == TokenKind::Identifier);
    CHECK(toks[1].kind == TokenKind::Identifier);
}

// ===== Numbers =====

TEST_CASE("tokenize decimal number", "[lexer]") {
    auto toks = tokenize("42");
    REQUIRE(toks.size() == 1);
    CHECK(toks[0].kind == TokenKind::Literal);
    CHECK(toks[0].text == "42");
}

TEST_CASE("numbers swallow prefixes, suffixes and dots", "[lexer]") {
    auto toks = tokenize("0xFFu 1.5f 10UL 1e10 1.2.3abc");
    REQUIRE(toks.size() == 5);
    CHECK(toks[0].text == "0xFFu");
    CHECK(toks[1].text == "1.5f");
    CHECK(toks[2].text == "10UL");
    CHECK(toks[3].text == "1e10");
    CHECK(toks[4].text == "1.2.3abc");
    for (const auto& t : toks) CHECK(t.kind == TokenKind::Literal);
}

TEST_CASE("exponent sign splits a number", "[lexer]") {
    auto toks = tokenize("1e-5");
    REQUIRE(toks.size() == 3);
    CHECK(toks[0].text == "1e");
    CHECK(toks[1].text == "-");
    CHECK(toks[2].text == "5");
}

TEST_CASE("leading dot is an operator", "[lexer]") {
    auto toks = tokenize(".5");
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].kind == TokenKind::Operator);
    CHECK(toks[1].text == "5");
}

// ===== Strings =====

TEST_CASE("tokenize string literal", "[lexer]") {
    auto toks = tokenize("\"hello world\"");
    REQUIRE(toks.size() == 1);
    CHECK(toks[0].kind == TokenKind::Literal);
    CHECK(toks[0].text == "\"hello world\"");
}

TEST_CASE("tokenize char literal", "[lexer]") {
    auto toks = tokenize("'a' '\\n'");
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].text == "'a'");
    CHECK(toks[1].text == "'\\n'");
}

TEST_CASE("escaped quote does not close the string", "[lexer]") {
    auto toks = tokenize("\"say \\\"hi\\\"\" x");
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].text == "\"say \\\"hi\\\"\"");
    CHECK(toks[1].text == "x");
}

TEST_CASE("other quote kind inside a string is plain text", "[lexer]") {
    auto toks = tokenize("\"it's\" 'a\"'");
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].text == "\"it's\"");
    CHECK(toks[1].text == "'a\"'");
}

TEST_CASE("escaped newline stays inside the string", "[lexer]") {
    auto toks = tokenize("\"a\\\nb\" c");
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].text == "\"a\\\nb\"");
    CHECK(toks[1].text == "c");
    CHECK(toks[1].pos.line == 2);
}

TEST_CASE("unterminated string runs to end of input", "[lexer]") {
    auto toks = tokenize("x = \"never closed; int y = 1;");
    REQUIRE(toks.size() == 3);
    CHECK(toks[2].kind == TokenKind::Literal);
    CHECK(toks[2].text == "\"never closed; int y = 1;");
}

TEST_CASE("backslash at end of input inside a string", "[lexer]") {
    auto toks = tokenize("\"abc\\");
    REQUIRE(toks.size() == 1);
    CHECK(toks[0].text == "\"abc\\");
}

// ===== Comments =====

TEST_CASE("line comment is dropped", "[lexer]") {
    auto toks = tokenize("foo // int hidden = 1;\nbar");
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].text == "foo");
    CHECK(toks[1].text == "bar");
    CHECK(toks[1].pos.line == 2);
    CHECK(toks[1].pos.col == 1);
}

TEST_CASE("block comment is dropped and tracks lines", "[lexer]") {
    auto toks = tokenize("a /* one\ntwo\nthree */ b");
    REQUIRE(toks.size() == 2);
    CHECK(toks[1].text == "b");
    CHECK(toks[1].pos.line == 3);
    CHECK(toks[1].pos.col == 10);
}

TEST_CASE("unterminated block comment runs to end of input", "[lexer]") {
    auto toks = tokenize("a /* int x = 1;\n");
    REQUIRE(toks.size() == 1);
    CHECK(toks[0].text == "a");
}

TEST_CASE("comment markers inside strings are text", "[lexer]") {
    auto toks = tokenize("\"http://x\" '/*'");
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].text == "\"http://x\"");
    CHECK(toks[1].text == "'/*'");
}

TEST_CASE("lone slash is an operator", "[lexer]") {
    auto toks = tokenize("a / b");
    REQUIRE(toks.size() == 3);
    CHECK(toks[1].kind == TokenKind::Operator);
    CHECK(toks[1].text == "/");
}

// ===== Operators =====

TEST_CASE("every punctuation character is its own operator", "[lexer]") {
    std::string ops = "{}[]()=<>!+-*%&|^~?:.,;";
    auto toks = tokenize(ops);
    REQUIRE(toks.size() == ops.size());
    for (size_t i = 0; i < ops.size(); ++i) {
        CHECK(toks[i].kind == TokenKind::Operator);
        CHECK(toks[i].text == std::string(1, ops[i]));
    }
}

TEST_CASE("multi-character operators are not merged", "[lexer]") {
    auto toks = tokenize("a<<=b==c->d::e");
    std::vector<std::string> texts;
    for (const auto& t : toks) texts.push_back(t.text);
    std::vector<std::string> expected = {
        "a", "<", "<", "=", "b", "=", "=", "c", "-", ">", "d", ":", ":", "e"};
    CHECK(texts == expected);
}

TEST_CASE("is_op matches single-character operators only", "[lexer]") {
    auto toks = tokenize("; \";\"");
    REQUIRE(toks.size() == 2);
    CHECK(toks[0].is_op(';'));
    CHECK_FALSE(toks[0].is_op(','));
    CHECK_FALSE(toks[1].is_op(';'));
}

TEST_CASE("default-constructed token is an empty identifier", "[lexer]") {
    Token t;
    CHECK(t.kind == TokenKind::Identifier);
    CHECK(t.text.empty());
    CHECK(t.pos.line == 1);
    CHECK(t.pos.col == 1);
    CHECK_FALSE(t.is_op(';'));
}

// ===== Unclassifiable input =====

TEST_CASE("unknown bytes are skipped", "[lexer]") {
    auto toks = tokenize("#include <a.h>\n@x $y `z\\");
    std::vector<std::string> texts;
    for (const auto& t : toks) texts.push_back(t.text);
    std::vector<std::string> expected = {
        "include", "<", "a", ".", "h", ">", "x", "y", "z"};
    CHECK(texts == expected);
}

TEST_CASE("non-ASCII and NUL bytes are skipped", "[lexer]") {
    std::string src = "a\xC3\xA9" "b";
    src += '\0';
    src += "c";
    auto toks = tokenize(src);
    REQUIRE(toks.size() == 3);
    CHECK(toks[0].text == "a");
    CHECK(toks[1].text == "b");
    CHECK(toks[2].text == "c");
}

// ===== Positions =====

TEST_CASE("line and column are 1-based", "[lexer]") {
    auto toks = tokenize("int x;\n  float y;");
    REQUIRE(toks.size() == 6);
    CHECK(toks[0].pos.line == 1);
    CHECK(toks[0].pos.col == 1);
    CHECK(toks[1].pos.col == 5);
    CHECK(toks[2].pos.col == 6);
    CHECK(toks[3].pos.line == 2);
    CHECK(toks[3].pos.col == 3);
    CHECK(toks[4].pos.col == 9);
}

TEST_CASE("column after a multi-line string", "[lexer]") {
    auto toks = tokenize("\"a\\\nbc\" d");
    REQUIRE(toks.size() == 2);
    CHECK(toks[1].pos.line == 2);
    CHECK(toks[1].pos.col == 5);
}

// ===== Properties =====

TEST_CASE("no token has empty text", "[lexer]") {
    const char* inputs[] = {
        "", "\"", "'", "/*", "//", "\\", "0", "a", "\"\\", "/* */ */",
        "int x = 0x; /* \" */ '\\'' \"\\\\\"",
    };
    for (const char* in : inputs) {
        for (const auto& t : tokenize(in)) {
            CHECK_FALSE(t.text.empty());
        }
    }
}

TEST_CASE("skipped spans reinsert to the original source", "[lexer]") {
    std::string src =
        "// header\n"
        "#include <stdint.h>\n"
        "static const float kEpsilon = 0.001f; /* tol */\n"
        "uint8_t buf[16];\t\n"
        "const char* s = \"a // not comment\";\n"
        "char c = '\\'';\n"
        "@@ int y = 1.2.3abc; \xFF\n";
    auto toks = tokenize(src);
    REQUIRE_FALSE(toks.empty());
    CHECK(rebuild(src, toks) == src);
}

TEST_CASE("tokenize is deterministic", "[lexer]") {
    std::string src = "int a = 1; { char* b; } /* c */";
    auto first = tokenize(src);
    auto second = tokenize(src);
    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        CHECK(first[i].text == second[i].text);
        CHECK(first[i].kind == second[i].kind);
        CHECK(first[i].pos.offset == second[i].pos.offset);
    }
}

TEST_CASE("token_kind_name covers every kind", "[lexer]") {
    CHECK(std::string(token_kind_name(TokenKind::Identifier)) == "Identifier");
    CHECK(std::string(token_kind_name(TokenKind::Keyword)) == "Keyword");
    CHECK(std::string(token_kind_name(TokenKind::Literal)) == "Literal");
    CHECK(std::string(token_kind_name(TokenKind::Operator)) == "Operator");
}
