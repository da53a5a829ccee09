#pragma once

#include <lexforge/lang/token.hpp>
#include <string>

namespace lexforge {

// A failure found while scanning input text. Always reported as a value.
struct ScanError {
    enum Kind {
        UnmatchedInput,     // no scanner and no whitespace rule applies
        UnterminatedBlock   // open delimiter without a matching close
    };

    Kind kind;
    SourcePos pos;
    std::string text;        // offending character, or the block's open delimiter
    std::string token_type;  // scanner context for UnterminatedBlock

    static ScanError unmatched_input(size_t offset, std::string text);
    static ScanError unterminated_block(size_t offset, std::string open,
                                        std::string token_type);

    std::string message() const;
    // Render as "error[Kind]: message" with a "--> file:line:col" locator
    std::string format(const std::string& filename = "<input>") const;
    static const char* kind_name(Kind k);
};

inline bool operator==(const ScanError& a, const ScanError& b) {
    return a.kind == b.kind && a.pos == b.pos && a.text == b.text &&
           a.token_type == b.token_type;
}

} // namespace lexforge
