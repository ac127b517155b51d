// =============================================================================
// cramdec - Logger Module Implementation
// =============================================================================

#include "cramdec/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cramdec::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

std::atomic<quill::Logger*> gLogger{nullptr};

std::atomic<bool> gInitialized{false};

std::mutex gInitMutex;

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/// @brief Read an environment variable, empty if unset.
std::string readEnv(std::string_view name) {
    const std::string key(name);
    const char* value = std::getenv(key.c_str());
    return value != nullptr ? std::string(value) : std::string{};
}

}  // namespace

// =============================================================================
// Config Implementation
// =============================================================================

VoidResult Config::validate() const {
    if (loggerName.empty()) {
        return makeVoidError(ErrorCode::kInvalidArgument, "logger name must not be empty");
    }
    if (!enableConsole && logFile.empty()) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "logging needs the console or a log file");
    }
    return makeVoidSuccess();
}

// =============================================================================
// Level Conversion Implementation
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

Level levelFromString(std::string_view levelStr) noexcept {
    const std::string lower = toLower(levelStr);

    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    if (lower == "critical" || lower == "fatal") {
        return Level::kCritical;
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
    }
    return "info";
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

VoidResult init(const Config& config) {
    if (auto valid = config.validate(); !valid) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gInitialized.load(std::memory_order_acquire)) {
        return makeVoidSuccess();
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    if (!config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('a');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{}));
    }

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
    return makeVoidSuccess();
}

VoidResult init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    return init(config);
}

Config configFromEnvironment() {
    Config config;
    if (const std::string level = readEnv(kLevelEnvVar); !level.empty()) {
        config.level = levelFromString(level);
    }
    config.logFile = readEnv(kFileEnvVar);
    return config;
}

VoidResult initFromEnvironment() {
    return init(configFromEnvironment());
}

// =============================================================================
// Logger Access Implementation
// =============================================================================

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* loggerPtr = logger(); loggerPtr != nullptr) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    if (isInitialized()) {
        flush();
        quill::Backend::stop();
        gLogger.store(nullptr, std::memory_order_release);
        gInitialized.store(false, std::memory_order_release);
    }
}

}  // namespace cramdec::log
