#include <lexforge/lang/error_collector.hpp>

namespace lexforge {

ErrorCollector::Verdict ErrorCollector::record(ScanError err) {
    errors_.push_back(std::move(err));
    if (!continue_on_error_) return Verdict::Abort;
    if (errors_.size() > limit_) return Verdict::Abort;
    return Verdict::Continue;
}

} // namespace lexforge
