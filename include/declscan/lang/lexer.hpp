#pragma once

#include <declscan/lang/token.hpp>
#include <string>
#include <vector>

namespace declscan {

// Split C-family source into classified tokens. Whitespace and comments are
// dropped, bytes outside the recognized classes are skipped. Never fails:
// unterminated strings and block comments run to end of input.
std::vector<Token> tokenize(const std::string& source);

} // namespace declscan
