#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include <Eigen/Dense>

namespace mhcbind {
namespace log_utils {

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    const int64_t hours = total_minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// "[v0, v1, ..., v(n-1)]" for the first n entries, "..." appended when truncated
inline std::string format_head(const Eigen::VectorXd& values, Eigen::Index n = 10, int precision = 4) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << '[';
    const Eigen::Index shown = std::min(n, values.size());
    for (Eigen::Index i = 0; i < shown; ++i) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    if (shown < values.size()) oss << ", ...";
    oss << ']';
    return oss.str();
}

}  // namespace log_utils
}  // namespace mhcbind
