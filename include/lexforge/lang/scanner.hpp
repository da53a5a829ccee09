#pragma once

#include <lexforge/lang/scan_error.hpp>
#include <lexforge/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace re2 {
class RE2;
}

namespace lexforge {

// Pattern (RE2 syntax) anchored at the cursor; a leading '^' anchors there
// too. Compiled once, at registration, and shared between copies.
struct RegexScanner {
    std::string pattern;
    std::shared_ptr<const re2::RE2> re;
    std::string token_type;
    std::optional<std::string> sub_type;
};

struct SymbolScanner {
    std::string literal;
    std::string token_type;
    std::optional<std::string> sub_type;
};

struct BlockScanner {
    std::string open;
    std::string close;
    std::string token_type;
    std::optional<std::string> sub_type;
    bool allow_nesting = false;
    bool raw_mode = false;
    bool include_delimiters = true;
    // Escape introducer for non-raw blocks; escape + next character is one
    // opaque unit that never matches a delimiter. Ignored in raw mode.
    std::optional<char> escape;
};

using ScannerDefinition = std::variant<RegexScanner, SymbolScanner, BlockScanner>;

// Half-open byte ranges into the input
struct Span {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end - begin; }
};

struct ScanMatch {
    Span span;   // everything the cursor moves past
    Span value;  // the part that becomes Token::value
};

using MatchResult = Result<ScanMatch, ScanError>;

// Build a RegexScanner, compiling the pattern. Fails on an empty or invalid
// pattern.
Result<RegexScanner> make_regex_scanner(const std::string& pattern,
                                        std::string token_type,
                                        std::optional<std::string> sub_type);

// Reject definitions that could never scan sensibly (empty literals or
// delimiters, empty token types, nesting with identical delimiters).
Status validate_scanner(const ScannerDefinition& def);

// Try `def` at `offset`. std::nullopt when its start condition does not hold;
// otherwise the match, or a ScanError when a block opened but never closed.
std::optional<MatchResult> match_scanner(const ScannerDefinition& def,
                                         std::string_view input,
                                         size_t offset);

const std::string& scanner_token_type(const ScannerDefinition& def);
const std::optional<std::string>& scanner_sub_type(const ScannerDefinition& def);
// "regex", "symbol" or "block"
const char* scanner_kind_name(const ScannerDefinition& def);

} // namespace lexforge
