#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace orotune {

/**
 * @brief Logging level policy
 *
 * - `Error`: a session computation was abandoned.
 * - `Warn`: screened trials, skipped sessions, degenerate fits.
 * - `Info`: per-session and per-unit progress.
 * - `Debug`: per-shift fit failures and detector internals.
 */
enum class LogVerbosity {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

/// Set the global log verbosity (default: Warn)
void set_log_verbosity(LogVerbosity level);

/// Get the global log verbosity
LogVerbosity get_log_verbosity();

/// True if messages at `level` are currently emitted
bool should_log(LogVerbosity level);

/// Write one formatted line to stderr
void log_line(LogVerbosity level, const std::string& message,
              const char* file, int line);

std::string_view to_string(LogVerbosity level);

}  // namespace orotune

#define OROTUNE_LOG(level, message)                                            \
    do {                                                                       \
        if (::orotune::should_log(level)) {                                    \
            std::ostringstream _orotune_log_stream;                            \
            _orotune_log_stream << message;                                    \
            ::orotune::log_line(level, _orotune_log_stream.str(),              \
                                __FILE__, __LINE__);                           \
        }                                                                      \
    } while (0)

#define OROTUNE_LOG_ERROR(message) OROTUNE_LOG(::orotune::LogVerbosity::Error, message)
#define OROTUNE_LOG_WARN(message) OROTUNE_LOG(::orotune::LogVerbosity::Warn, message)
#define OROTUNE_LOG_INFO(message) OROTUNE_LOG(::orotune::LogVerbosity::Info, message)
#define OROTUNE_LOG_DEBUG(message) OROTUNE_LOG(::orotune::LogVerbosity::Debug, message)
