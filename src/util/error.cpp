#include <lexforge/error.hpp>

namespace lexforge {

const char* LexError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
        case NotFound:   return "NotFound";
    }
    return "Unknown";
}

LexError& LexError::located(std::string f) {
    file = std::move(f);
    return *this;
}

std::string LexError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":" + std::to_string(line);
            if (column > 0) result += ":" + std::to_string(column);
        }
    } else if (line > 0) {
        result += "\n  --> line " + std::to_string(line);
        if (column > 0) result += ", column " + std::to_string(column);
    }

    return result;
}

} // namespace lexforge
