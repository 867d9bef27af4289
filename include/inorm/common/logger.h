// =============================================================================
// infinium-norm - Logger Module
// =============================================================================
// Process-wide Quill logger shared by the pipeline and its TBB workers.
//
// The INORM_LOG_* macros are no-ops until init() has been called, so the
// library stays silent when embedded in a host application or run from the
// unit tests. Only the command-line tool installs a logger.
//
// Usage:
//   inorm::log::Config config;
//   config.logFile = "run.log";
//   inorm::log::init(config);
//   INORM_LOG_INFO("Processed {} samples", 12);
// =============================================================================

#ifndef INORM_COMMON_LOGGER_H
#define INORM_COMMON_LOGGER_H

#include <string>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace inorm::log {

/// @brief Verbosity selected by the --quiet / --verbose / --debug flags.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

struct Config {
    /// @brief Run log written next to the outputs. Empty disables it.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Progress and errors on the console.
    bool enableConsole = true;
};

/// @brief Start the Quill backend and install the process logger.
/// @note Later calls are ignored until shutdown().
void init(const Config& config);

/// @return The installed logger, nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Flush pending records and stop the backend thread.
void shutdown();

}  // namespace inorm::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define INORM_LOG_IMPL(MACRO, fmt, ...)                                  \
    do {                                                                 \
        if (quill::Logger* inormLogger_ = ::inorm::log::logger()) {      \
            MACRO(inormLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                                \
    } while (false)

#define INORM_LOG_TRACE(fmt, ...) INORM_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

#define INORM_LOG_DEBUG(fmt, ...) INORM_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

#define INORM_LOG_INFO(fmt, ...) INORM_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

#define INORM_LOG_WARNING(fmt, ...) INORM_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

#define INORM_LOG_ERROR(fmt, ...) INORM_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

#define INORM_LOG_CRITICAL(fmt, ...) INORM_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // INORM_COMMON_LOGGER_H
