#include <declscan/lang/lexer.hpp>
#include <cctype>
#include <cstring>

namespace declscan {

// ---------------------------------------------------------------------------
// Keyword table
// ---------------------------------------------------------------------------

const std::unordered_set<std::string>& cpp_keywords() {
    static const std::unordered_set<std::string> table = {
        // Builtin and fixed-width types
        "int", "float", "double", "char", "void", "bool", "auto",
        "uint8_t", "uint16_t", "uint32_t", "uint64_t",
        // Storage and sign modifiers
        "const", "static", "unsigned", "signed",
        // Class-like
        "class", "struct", "enum", "namespace", "template",
        // Control flow
        "if", "else", "for", "while", "switch", "case", "return", "break",
        // Access and inheritance
        "public", "private", "protected", "virtual", "override",
    };
    return table;
}

bool is_keyword(const std::string& text) {
    return cpp_keywords().count(text) != 0;
}

const char* token_kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::Identifier: return "Identifier";
    case TokenKind::Keyword:    return "Keyword";
    case TokenKind::Literal:    return "Literal";
    case TokenKind::Operator:   return "Operator";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

const char kOperatorChars[] = "{}[]()=<>!+-*/%&|^~?:.,;";

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

struct Lexer {
    const std::string& source;
    size_t pos;
    int line;
    int col;

    std::vector<Token> tokens;

    explicit Lexer(const std::string& src)
        : source(src), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char peek_next() const {
        return (pos + 1 < source.size()) ? source[pos + 1] : '\0';
    }

    void advance() {
        if (source[pos++] == '\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
    }

    SourcePos current_pos() const {
        return {line, col, pos};
    }

    void emit(TokenKind kind, const SourcePos& start) {
        tokens.push_back({kind, source.substr(start.offset, pos - start.offset), start});
    }

    std::vector<Token> run() {
        while (!at_end()) {
            char c = peek();

            if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
                continue;
            }

            auto p = current_pos();

            if (is_ident_start(c)) {
                lex_identifier(p);
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(c))) {
                lex_number(p);
                continue;
            }

            if (c == '"' || c == '\'') {
                lex_quoted(p, c);
                continue;
            }

            if (c == '/' && peek_next() == '/') {
                skip_line_comment();
                continue;
            }
            if (c == '/' && peek_next() == '*') {
                skip_block_comment();
                continue;
            }

            if (std::strchr(kOperatorChars, c) != nullptr) {
                advance();
                emit(TokenKind::Operator, p);
                continue;
            }

            // Unclassifiable byte ('#', '@', '\\', non-ASCII, NUL...)
            advance();
        }
        return std::move(tokens);
    }

    void lex_identifier(const SourcePos& p) {
        while (!at_end() && is_ident_char(peek())) {
            advance();
        }
        bool kw = is_keyword(source.substr(p.offset, pos - p.offset));
        emit(kw ? TokenKind::Keyword : TokenKind::Identifier, p);
    }

    // Accepts hex, suffixes and exponents without validating them
    void lex_number(const SourcePos& p) {
        while (!at_end() && (std::isalnum(static_cast<unsigned char>(peek())) ||
                              peek() == '.')) {
            advance();
        }
        emit(TokenKind::Literal, p);
    }

    void lex_quoted(const SourcePos& p, char quote) {
        advance(); // opening quote
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                advance();
                if (!at_end()) advance();
                continue;
            }
            advance();
            if (c == quote) break;
        }
        emit(TokenKind::Literal, p);
    }

    void skip_line_comment() {
        while (!at_end() && peek() != '\n') {
            advance();
        }
    }

    void skip_block_comment() {
        advance(); // /
        advance(); // *
        while (!at_end()) {
            if (peek() == '*' && peek_next() == '/') {
                advance();
                advance();
                return;
            }
            advance();
        }
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::vector<Token> tokenize(const std::string& source) {
    Lexer lexer(source);
    return lexer.run();
}

} // namespace declscan
