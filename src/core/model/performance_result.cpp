#include "wirecheck/core/model/performance_result.hpp"

#include <sstream>


namespace wirecheck::core {

std::string PerformanceResult::summary() const {
    std::ostringstream oss;
    if (!ok()) {
        oss << "Load plan rejected: " << config::to_string(config_error);
        if (!config_message.empty()) {
            oss << " (" << config_message << ")";
        }
        return oss.str();
    }
    oss << "Load run (" << load::to_string(plan.pattern) << ", target " << plan.target
        << ", peak target " << peak_target << ", max in flight " << max_in_flight << ")";
    if (cancelled) {
        oss << " [cancelled: " << cancel_reason << "]";
    }
    oss << "\n" << stats.str();
    return oss.str();
}

} // namespace wirecheck::core
