#include "wirecheck/core/model/run_result.hpp"

#include <sstream>


namespace wirecheck::core {

std::string RunResult::summary() const {
    std::ostringstream oss;
    if (!ok()) {
        oss << "Suite '" << suite << "' rejected: " << config::to_string(config_error);
        if (!config_message.empty()) {
            oss << " (" << config_message << ")";
        }
        return oss.str();
    }
    const char* verdict = !passed ? "FAILED" : (executed() ? "PASSED" : "NOT RUN");
    oss << "Suite '" << suite << "' " << verdict
        << ": " << counts.total << " unit(s), "
        << counts.passed << " passed, "
        << counts.failed << " failed, "
        << counts.flaky << " flaky, "
        << counts.skipped << " skipped, "
        << counts.cancelled << " cancelled";
    if (counts.pending) {
        oss << ", " << counts.pending << " pending";
    }
    oss << " in " << duration.count() << " ms";
    if (cancelled) {
        oss << " [cancelled: " << cancel_reason << "]";
    }
    return oss.str();
}

} // namespace wirecheck::core
