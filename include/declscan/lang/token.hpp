#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>

namespace declscan {

// Position of a token's first byte
struct SourcePos {
    int line = 1;
    int col = 1;
    size_t offset = 0;
};

enum class TokenKind {
    Identifier,
    Keyword,
    Literal,   // numeric, string or char
    Operator   // always a single punctuation character
};

struct Token {
    TokenKind kind = TokenKind::Identifier;
    std::string text;  // exact source slice, never empty
    SourcePos pos;

    bool is_op(char c) const {
        return kind == TokenKind::Operator && text.size() == 1 && text[0] == c;
    }
};

// Reserved words recognized as TokenKind::Keyword. Closed set.
const std::unordered_set<std::string>& cpp_keywords();

bool is_keyword(const std::string& text);

const char* token_kind_name(TokenKind k);

} // namespace declscan
