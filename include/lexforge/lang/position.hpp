#pragma once

#include <lexforge/lang/token.hpp>
#include <string_view>

namespace lexforge {

// Incremental offset -> (line, column) conversion. Offsets only move forward
// during a scan, so each byte of input is visited at most once.
class PositionTracker {
public:
    explicit PositionTracker(std::string_view input, bool enabled = true)
        : input_(input), enabled_(enabled) {}

    // Position of the character starting at `offset`. Offsets must be
    // non-decreasing across calls. Returns line/col 0 when disabled.
    SourcePos at(size_t offset);

    bool enabled() const { return enabled_; }

private:
    std::string_view input_;
    bool enabled_;
    size_t offset_ = 0;
    int line_ = 1;
    int col_ = 1;
};

} // namespace lexforge
