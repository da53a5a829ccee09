#pragma once

#include <cstddef>

namespace lexforge {

// Per-run options. Copied into the Tokenizer at construction.
struct TokenizerConfig {
    // Emit whitespace runs as "Whitespace" tokens instead of skipping them
    bool tokenize_whitespace = true;
    // Keep scanning after a failure to gather more diagnostics
    bool continue_on_error = false;
    // Abort once more than this many errors have been recorded
    size_t error_tolerance_limit = 10;
    // Compute line/column for tokens and errors
    bool track_token_positions = true;
};

} // namespace lexforge
