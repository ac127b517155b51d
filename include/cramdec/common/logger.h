// =============================================================================
// cramdec - Logger Module
// =============================================================================
// Low-latency asynchronous logging using the Quill library.
//
// The library logs through the CRAMDEC_LOG_* macros below. They are no-ops
// until the host application calls cramdec::log::init() (or
// initFromEnvironment()), so decoding code can log unconditionally.
//
// Usage:
//   cramdec::log::init("decode.log", cramdec::log::Level::kDebug);
//   CRAMDEC_LOG_INFO("decoded {} records", count);
// =============================================================================

#ifndef CRAMDEC_COMMON_LOGGER_H
#define CRAMDEC_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include "cramdec/common/error.h"

namespace cramdec::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Environment variable holding the log level name.
inline constexpr std::string_view kLevelEnvVar = "CRAMDEC_LOG_LEVEL";

/// @brief Environment variable holding the log file path.
inline constexpr std::string_view kFileEnvVar = "CRAMDEC_LOG_FILE";

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "cramdec";

    /// @brief Validate configuration.
    /// @return VoidResult, error if the logger name is empty or no sink is enabled.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Only the first successful call takes effect.
/// @return Error if the configuration is invalid.
VoidResult init(const Config& config);

/// @brief Initialize the global logger with a file and level.
VoidResult init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Build a Config from CRAMDEC_LOG_LEVEL and CRAMDEC_LOG_FILE.
/// @note Unset variables keep the Config defaults.
[[nodiscard]] Config configFromEnvironment();

/// @brief Initialize the global logger from the environment.
VoidResult initFromEnvironment();

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush and stop the logging backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive), kInfo if unknown.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace cramdec::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define CRAMDEC_LOG_IMPL(MACRO, fmt, ...)                                       \
    do {                                                                        \
        if (quill::Logger* cramdecLogger = cramdec::log::logger()) {            \
            MACRO(cramdecLogger, fmt __VA_OPT__(, ) __VA_ARGS__);               \
        }                                                                       \
    } while (0)

/// @brief Log a trace message.
#define CRAMDEC_LOG_TRACE(fmt, ...) CRAMDEC_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define CRAMDEC_LOG_DEBUG(fmt, ...) CRAMDEC_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define CRAMDEC_LOG_INFO(fmt, ...) CRAMDEC_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define CRAMDEC_LOG_WARNING(fmt, ...) \
    CRAMDEC_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define CRAMDEC_LOG_ERROR(fmt, ...) CRAMDEC_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define CRAMDEC_LOG_CRITICAL(fmt, ...) \
    CRAMDEC_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // CRAMDEC_COMMON_LOGGER_H
