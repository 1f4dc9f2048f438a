#include <declscan/error.hpp>
#include <sstream>

namespace declscan {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::IO:         return "IO";
    case ErrorCode::Config:     return "Config";
    case ErrorCode::NotFound:   return "NotFound";
    case ErrorCode::TooLarge:   return "TooLarge";
    case ErrorCode::InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

DeclscanError& DeclscanError::at(const std::string& p, int l) {
    if (path.empty()) {
        path = p;
        line = l;
    }
    return *this;
}

std::string DeclscanError::format() const {
    std::ostringstream out;
    out << "error[" << error_code_name(code) << "]: " << message;
    if (!hint.empty()) out << "\n  hint: " << hint;
    if (has_location()) {
        out << "\n  --> " << path;
        if (line > 0) out << ':' << line;
    }
    return out.str();
}

} // namespace declscan
