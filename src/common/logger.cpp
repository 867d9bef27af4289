// =============================================================================
// infinium-norm - Logger Module Implementation
// =============================================================================

#include "inorm/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace inorm::log {

namespace {

constexpr const char* kLoggerName = "inorm";

std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gLifecycleMutex;

[[nodiscard]] quill::LogLevel quillLevel(Level level) noexcept {
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

/// @brief Sinks for one run; the console is kept when nothing else is requested.
[[nodiscard]] std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }
    return sinks;
}

}  // namespace

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});
    quill::Logger* installed = quill::Frontend::create_or_get_logger(kLoggerName, makeSinks(config));
    installed->set_log_level(quillLevel(config.level));
    gLogger.store(installed, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* installed = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (installed == nullptr) {
        return;
    }
    installed->flush_log();
    quill::Backend::stop();
}

}  // namespace inorm::log
