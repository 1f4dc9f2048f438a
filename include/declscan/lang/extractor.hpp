#pragma once

#include <declscan/lang/ir.hpp>
#include <declscan/lang/token.hpp>
#include <vector>

namespace declscan {

// Find variable declarations in a token stream. Every candidate that does
// not match is dropped without trace; the result is in source order.
std::vector<Declaration> extract(const std::vector<Token>& tokens);

// Same pass, also returning the scope tree the declarations were found in.
ExtractResult extract_scopes(const std::vector<Token>& tokens);

} // namespace declscan
