#include <clex/error.hpp>

namespace clex {

const char* ClexError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case InvalidArg: return "InvalidArg";
        case Lex:        return "Lex";
        case Internal:   return "Internal";
    }
    return "Unknown";
}

int ClexError::exit_code() const {
    switch (code) {
        case IO:
        case InvalidArg: return 1;
        case Lex:        return 2;
        case Internal:   return 3;
    }
    return 3;
}

std::string ClexError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":" + std::to_string(line);
            if (col > 0) result += ":" + std::to_string(col);
        }
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace clex
