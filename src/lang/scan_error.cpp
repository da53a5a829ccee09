#include <lexforge/lang/scan_error.hpp>

namespace lexforge {

ScanError ScanError::unmatched_input(size_t offset, std::string text) {
    ScanError e;
    e.kind = UnmatchedInput;
    e.pos.offset = offset;
    e.text = std::move(text);
    return e;
}

ScanError ScanError::unterminated_block(size_t offset, std::string open,
                                        std::string token_type) {
    ScanError e;
    e.kind = UnterminatedBlock;
    e.pos.offset = offset;
    e.text = std::move(open);
    e.token_type = std::move(token_type);
    return e;
}

const char* ScanError::kind_name(Kind k) {
    switch (k) {
        case UnmatchedInput:    return "UnmatchedInput";
        case UnterminatedBlock: return "UnterminatedBlock";
    }
    return "Unknown";
}

// Control characters are shown as escapes so diagnostics stay on one line
static std::string printable(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c < 0x20 || c == 0x7f) {
                static const char hex[] = "0123456789abcdef";
                out += "\\x";
                out += hex[c >> 4];
                out += hex[c & 0xf];
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    return out;
}

std::string ScanError::message() const {
    switch (kind) {
    case UnmatchedInput:
        return "unexpected character '" + printable(text) + "' at offset " +
               std::to_string(pos.offset);
    case UnterminatedBlock:
        return "unterminated " + token_type + " block opened by '" +
               printable(text) + "' at offset " + std::to_string(pos.offset);
    }
    return "unknown scan error";
}

std::string ScanError::format(const std::string& filename) const {
    std::string result = "error[";
    result += kind_name(kind);
    result += "]: ";
    result += message();
    result += "\n  --> ";
    result += filename;
    if (pos.line > 0) {
        result += ":" + std::to_string(pos.line) + ":" + std::to_string(pos.col);
    }
    return result;
}

} // namespace lexforge
