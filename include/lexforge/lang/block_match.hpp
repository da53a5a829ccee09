#pragma once

#include <lexforge/lang/scanner.hpp>

namespace lexforge {

// Find the logical end of a block whose open delimiter starts at `start`.
// Scanning begins at start + open.size(). Nesting is tracked with a counter,
// so arbitrarily deep input costs no stack.
//
// On success the match span runs from `start` through the matching close
// delimiter and the value span honors include_delimiters. Reaching the end
// of input first yields an UnterminatedBlock error at `start`.
MatchResult match_block(const BlockScanner& block, std::string_view input,
                        size_t start);

} // namespace lexforge
