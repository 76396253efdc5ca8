// =============================================================================
// uuid-compactor - Logger Module
// =============================================================================
// Quill-backed logging for the uuidc library.
//
// The library never starts logging itself. Until an application calls
// init(), logger() is nullptr and the UUIDC_LOG_* macros do nothing, so the
// codec performs no I/O for callers who do not opt in.
//
// Usage:
//   uuidc::log::Config config;
//   config.logFile = "uuidc.log";
//   config.level = uuidc::log::Level::kDebug;
//   uuidc::log::init(config);
//   ...
//   uuidc::log::shutdown();
// =============================================================================

#ifndef UUIDC_COMMON_LOGGER_H
#define UUIDC_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace uuidc::log {

enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError
};

struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Also write to stdout. Forced on when logFile is empty.
    bool enableConsole = true;
};

/// @brief Start the Quill backend and create the "uuidc" logger.
/// @note Ignored if already initialized.
void init(const Config& config);

/// @brief The active logger, nullptr before init() or after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Block until every message logged so far has reached the sinks.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

/// @brief Parse a level name, case-insensitively ("warn" is accepted).
[[nodiscard]] std::optional<Level> levelFromString(std::string_view name) noexcept;

}  // namespace uuidc::log

// Quill's macros dereference the logger, so each call checks it first.
#define UUIDC_LOG_IMPL(quillMacro, fmt, ...)                                 \
    do {                                                                     \
        if (quill::Logger* uuidcLogger = uuidc::log::logger()) {             \
            quillMacro(uuidcLogger, fmt __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                                    \
    } while (false)

#define UUIDC_LOG_DEBUG(fmt, ...) UUIDC_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define UUIDC_LOG_INFO(fmt, ...) UUIDC_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define UUIDC_LOG_WARNING(fmt, ...) UUIDC_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // UUIDC_COMMON_LOGGER_H
