// =============================================================================
// uuid-compactor - Logger Module Implementation
// =============================================================================

#include "uuidc/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace uuidc::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Serializes init() and shutdown().
std::mutex gLifecycleMutex;

constexpr std::array<std::pair<std::string_view, Level>, 6> kLevelNames{{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
}};

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
    }
    return quill::LogLevel::Info;
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

}  // namespace

std::optional<Level> levelFromString(std::string_view name) noexcept {
    for (const auto& [levelName, level] : kLevelNames) {
        if (equalsIgnoreCase(name, levelName)) {
            return level;
        }
    }
    return std::nullopt;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileSinkConfig;
        fileSinkConfig.set_open_mode('a');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileSinkConfig, quill::FileEventNotifier{}));
    }
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("uuidc_console"));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger("uuidc", std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* active = logger()) {
        active->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (logger() == nullptr) {
        return;
    }
    flush();
    quill::Backend::stop();
    gLogger.store(nullptr, std::memory_order_release);
}

}  // namespace uuidc::log
