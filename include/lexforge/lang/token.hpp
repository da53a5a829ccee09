#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace lexforge {

// Position of the first character of a token or diagnostic.
// line/col are 1-indexed and stay 0 when position tracking is disabled;
// offset is a byte offset into the input and is always filled in.
struct SourcePos {
    int line = 0;
    int col = 0;
    size_t offset = 0;
};

inline bool operator==(const SourcePos& a, const SourcePos& b) {
    return a.line == b.line && a.col == b.col && a.offset == b.offset;
}

inline bool operator!=(const SourcePos& a, const SourcePos& b) {
    return !(a == b);
}

struct Token {
    std::string type;
    std::optional<std::string> sub_type;
    std::string value;
    SourcePos pos;
};

inline bool operator==(const Token& a, const Token& b) {
    return a.type == b.type && a.sub_type == b.sub_type &&
           a.value == b.value && a.pos == b.pos;
}

inline bool operator!=(const Token& a, const Token& b) {
    return !(a == b);
}

// Type label used for the built-in whitespace rule
inline constexpr const char* kWhitespaceType = "Whitespace";

} // namespace lexforge
