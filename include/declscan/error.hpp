#pragma once

#include <string>

namespace declscan {

enum class ErrorCode {
    IO,
    Config,
    NotFound,
    TooLarge,
    InvalidArg
};

const char* error_code_name(ErrorCode code);

// Failure from the file layer. The lexer and extractor never produce one.
struct DeclscanError {
    ErrorCode code = ErrorCode::IO;
    std::string message;
    std::string hint;
    std::string path;  // offending file, empty when not tied to one
    int line = 0;

    DeclscanError() = default;
    DeclscanError(ErrorCode c, std::string msg, std::string h = "")
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Attach a location unless one is already recorded
    DeclscanError& at(const std::string& p, int l = 0);

    bool has_location() const { return !path.empty(); }

    // error[Code]: message
    //   hint: ...
    //   --> path:line
    std::string format() const;
};

} // namespace declscan
