#include "orotune/logging.hpp"
#include "orotune/types.hpp"

#include <atomic>
#include <mutex>

namespace orotune {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Warn)};
std::mutex g_log_mutex;  // Worker threads share stderr

}  // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

bool should_log(LogVerbosity level) {
    return static_cast<int>(level) <= g_log_level.load(std::memory_order_relaxed);
}

void log_line(LogVerbosity level, const std::string& message,
              const char* file, int line) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level == LogVerbosity::Error) {
        std::cerr << "[OroTune][" << to_string(level) << "][" << file << ":"
                  << line << "] " << message << "\n";
        return;
    }
    std::cerr << "[OroTune][" << to_string(level) << "] " << message << "\n";
}

std::string_view to_string(LogVerbosity level) {
    switch (level) {
        case LogVerbosity::Error: return "error";
        case LogVerbosity::Warn:  return "warn";
        case LogVerbosity::Info:  return "info";
        case LogVerbosity::Debug: return "debug";
    }
    return "unknown";
}

std::string_view to_string(AnalysisError error) {
    switch (error) {
        case AnalysisError::ShapeMismatch:        return "shape mismatch";
        case AnalysisError::TrialCountMismatch:   return "trial count mismatch";
        case AnalysisError::CorruptDecomposition: return "corrupt motion decomposition";
        case AnalysisError::EmptyInput:           return "empty input";
        case AnalysisError::InvalidConfig:        return "invalid configuration";
    }
    return "unknown";
}

std::optional<size_t> TrialTracking::frame_count() const {
    const Eigen::Index n = jaw_x.size();
    const bool consistent =
        jaw_y.size() == n && jaw_z.size() == n &&
        tongue_x.size() == n && tongue_y.size() == n && tongue_z.size() == n &&
        tongue_likelihood_side.size() == n && tongue_likelihood_bottom.size() == n;
    if (!consistent) {
        return std::nullopt;
    }
    return static_cast<size_t>(n);
}

}  // namespace orotune
