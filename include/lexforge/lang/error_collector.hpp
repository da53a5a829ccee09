#pragma once

#include <lexforge/lang/scan_error.hpp>
#include <lexforge/lang/tokenizer_config.hpp>
#include <vector>

namespace lexforge {

// Accumulates scan errors and applies the tolerance policy.
class ErrorCollector {
public:
    enum class Verdict { Continue, Abort };

    explicit ErrorCollector(const TokenizerConfig& config)
        : continue_on_error_(config.continue_on_error),
          limit_(config.error_tolerance_limit) {}

    // Every error is kept. Abort on the first one unless continue_on_error,
    // otherwise once the count exceeds the tolerance limit.
    Verdict record(ScanError err);

    bool empty() const { return errors_.empty(); }
    size_t count() const { return errors_.size(); }
    const std::vector<ScanError>& errors() const { return errors_; }
    std::vector<ScanError> take() { return std::move(errors_); }

private:
    bool continue_on_error_;
    size_t limit_;
    std::vector<ScanError> errors_;
};

} // namespace lexforge
