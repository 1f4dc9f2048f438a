#include <declscan/lang/extractor.hpp>

namespace declscan {

namespace {

using TK = TokenKind;

bool is_terminator(const Token& tok) {
    return tok.is_op(';') || tok.is_op(',');
}

// ---------------------------------------------------------------------------
// Extractor state machine
// ---------------------------------------------------------------------------

struct Extractor {
    const std::vector<Token>& tokens;
    size_t pos;

    // Lookahead tables: index of the next ']' / next ';' or ',' at or after i,
    // tokens.size() if none. Built once so a failing candidate never rescans.
    std::vector<size_t> next_rbracket;
    std::vector<size_t> next_terminator;

    ExtractResult result;
    std::vector<size_t> open;  // scope stack, indices into result.scopes

    explicit Extractor(const std::vector<Token>& toks)
        : tokens(toks), pos(0) {
        build_lookahead();

        Scope global;
        global.kind = ScopeKind::Global;
        global.start_line = tokens.empty() ? 0 : tokens.front().pos.line;
        result.scopes.push_back(std::move(global));
        open.push_back(0);
    }

    void build_lookahead() {
        size_t n = tokens.size();
        next_rbracket.assign(n + 1, n);
        next_terminator.assign(n + 1, n);
        for (size_t i = n; i-- > 0;) {
            next_rbracket[i] = tokens[i].is_op(']') ? i : next_rbracket[i + 1];
            next_terminator[i] = is_terminator(tokens[i]) ? i : next_terminator[i + 1];
        }
    }

    // -- Navigation ---------------------------------------------------------

    bool at_end() const { return pos >= tokens.size(); }

    const Token& peek() const { return tokens[pos]; }

    bool check_op(char c) const { return !at_end() && peek().is_op(c); }

    // -- Scopes -------------------------------------------------------------

    void open_scope(int line) {
        Scope s;
        s.kind = ScopeKind::Block;
        s.start_line = line;
        s.depth = static_cast<int>(open.size());
        s.parent = static_cast<int>(open.back());
        result.scopes.push_back(std::move(s));
        open.push_back(result.scopes.size() - 1);
    }

    void close_scope(int line) {
        // A stray '}' never pops the global scope
        if (open.size() <= 1) return;
        result.scopes[open.back()].end_line = line;
        open.pop_back();
    }

    // -- Main loop ----------------------------------------------------------

    void run() {
        while (!at_end()) {
            const Token& tok = peek();
            if (tok.is_op('{')) {
                open_scope(tok.pos.line);
            } else if (tok.is_op('}')) {
                close_scope(tok.pos.line);
            } else if (tok.kind == TK::Identifier || tok.kind == TK::Keyword) {
                try_declaration();
            }
            ++pos;
        }

        int last_line = tokens.empty() ? 0 : tokens.back().pos.line;
        for (size_t idx : open) {
            result.scopes[idx].end_line = last_line;
        }
    }

    // -- Speculative declaration match --------------------------------------

    // Match [modifiers] type [*&]* name [[...]] [= init] (';' | ',').
    // On success the cursor rests just before the terminator so the main
    // loop's advance lands on it; on failure it is back at the start.
    bool try_declaration() {
        const size_t start = pos;
        Declaration decl;
        std::string sign;

        while (!at_end()) {
            const std::string& text = peek().text;
            if (text == "static") {
                decl.is_static = true;
            } else if (text == "const") {
                decl.is_const = true;
            } else if (text == "unsigned" || text == "signed") {
                sign += text;
                sign += ' ';
            } else {
                break;
            }
            ++pos;
        }

        if (at_end()) return reject(start);
        const Token& type_tok = peek();
        if (type_tok.kind != TK::Identifier && type_tok.kind != TK::Keyword &&
            !is_keyword(type_tok.text)) {
            return reject(start);
        }
        decl.type = sign + type_tok.text;
        ++pos;

        while (check_op('*') || check_op('&')) {
            decl.type += peek().text;
            ++pos;
        }

        if (at_end() || peek().kind != TK::Identifier) return reject(start);
        const Token& name_tok = peek();
        ++pos;

        if (check_op('[')) {
            size_t close = next_rbracket[pos];
            if (close < tokens.size()) {
                pos = close + 1;
                decl.type += "[]";
            }
        }

        if (check_op('=')) {
            ++pos;
            size_t end = next_terminator[pos];
            if (end >= tokens.size()) return reject(start);
            decl.has_initializer = true;
            for (size_t i = pos; i < end; ++i) {
                if (i > pos) decl.initializer += ' ';
                decl.initializer += tokens[i].text;
            }
            pos = end;
        }

        if (at_end() || !is_terminator(peek())) return reject(start);

        decl.name = name_tok.text;
        decl.line = name_tok.pos.line;
        result.scopes[open.back()].declarations.push_back(decl);
        result.declarations.push_back(std::move(decl));
        --pos;
        return true;
    }

    bool reject(size_t start) {
        pos = start;
        return false;
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::vector<Declaration> extract(const std::vector<Token>& tokens) {
    return std::move(extract_scopes(tokens).declarations);
}

ExtractResult extract_scopes(const std::vector<Token>& tokens) {
    Extractor extractor(tokens);
    extractor.run();
    return std::move(extractor.result);
}

} // namespace declscan
