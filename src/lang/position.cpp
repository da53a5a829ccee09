#include <lexforge/lang/position.hpp>

namespace lexforge {

SourcePos PositionTracker::at(size_t offset) {
    SourcePos p;
    p.offset = offset;
    if (!enabled_) return p;

    if (offset > input_.size()) offset = input_.size();
    for (; offset_ < offset; ++offset_) {
        unsigned char c = static_cast<unsigned char>(input_[offset_]);
        if (c == '\n') {
            ++line_;
            col_ = 1;
        } else if ((c & 0xC0) != 0x80) {
            // UTF-8 continuation bytes do not start a new column
            ++col_;
        }
    }

    p.line = line_;
    p.col = col_;
    return p;
}

} // namespace lexforge
