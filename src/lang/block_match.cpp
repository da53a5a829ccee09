#include <lexforge/lang/block_match.hpp>
#include <algorithm>

namespace lexforge {

static bool literal_at(std::string_view input, size_t pos, const std::string& lit) {
    return input.compare(pos, lit.size(), lit) == 0;
}

// Length in bytes of the UTF-8 sequence starting at `pos`
static size_t unit_length(std::string_view input, size_t pos) {
    unsigned char c = static_cast<unsigned char>(input[pos]);
    size_t len = 1;
    if (c >= 0xF0) len = 4;
    else if (c >= 0xE0) len = 3;
    else if (c >= 0xC0) len = 2;
    return std::min(len, input.size() - pos);
}

MatchResult match_block(const BlockScanner& block, std::string_view input,
                        size_t start) {
    size_t pos = start + block.open.size();
    size_t depth = 1;
    bool escapes = !block.raw_mode && block.escape.has_value();

    while (pos < input.size()) {
        if (escapes && input[pos] == *block.escape) {
            pos += 1;
            if (pos < input.size()) pos += unit_length(input, pos);
            continue;
        }

        if (block.allow_nesting && literal_at(input, pos, block.open)) {
            ++depth;
            pos += block.open.size();
            continue;
        }

        if (literal_at(input, pos, block.close)) {
            pos += block.close.size();
            if (--depth == 0) {
                ScanMatch m;
                m.span = {start, pos};
                if (block.include_delimiters) {
                    m.value = m.span;
                } else {
                    m.value = {start + block.open.size(), pos - block.close.size()};
                }
                return MatchResult::ok(m);
            }
            continue;
        }

        ++pos;
    }

    return ScanError::unterminated_block(start, block.open, block.token_type);
}

} // namespace lexforge
