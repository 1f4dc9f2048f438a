#pragma once

#include <string>
#include <vector>

namespace declscan {

enum class ScopeKind {
    Global,
    Block   // any {...} level; functions, classes and statements alike
};

// One fuzzy-matched variable declaration
struct Declaration {
    std::string name;
    std::string type;          // e.g. "unsigned int", "char*", "uint8_t[]"
    std::string initializer;   // space-joined tokens after '=', or empty
    bool has_initializer = false;
    int line = 0;              // line of the name token
    bool is_static = false;
    bool is_const = false;
};

struct Scope {
    ScopeKind kind = ScopeKind::Global;
    int start_line = 0;
    int end_line = 0;
    int depth = 0;        // 0 = global
    int parent = -1;      // index into ExtractResult::scopes, -1 for global
    std::vector<Declaration> declarations;  // directly inside, not nested
};

struct ExtractResult {
    std::vector<Declaration> declarations;  // all scopes, source order
    std::vector<Scope> scopes;              // global first, then opening order
};

} // namespace declscan
