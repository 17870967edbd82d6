#include "common/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace biokg {

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARNING:  return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

std::optional<LogLevel> findLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error" || lower == "err") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    if (lower == "off") return LogLevel::OFF;
    return std::nullopt;
}

LogLevel parseLogLevel(const std::string& name) {
    return findLogLevel(name).value_or(LogLevel::INFO);
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    spdlog::sink_ptr file_sink;
    LogLevel level = LogLevel::INFO;
    std::mutex mutex;

    Impl() {
        // Console goes to stderr so command output on stdout stays parseable.
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        logger = std::make_shared<spdlog::logger>("biokg", console_sink);
        logger->set_level(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
    }

    LogLevel currentLevel() {
        std::lock_guard<std::mutex> lock(mutex);
        return level;
    }

    void setLevel(LogLevel lvl) {
        std::lock_guard<std::mutex> lock(mutex);
        level = lvl;
        logger->set_level(toSpdlog(lvl));
    }

    void setOutputFile(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex);
        auto& sinks = logger->sinks();
        if (file_sink) {
            sinks.erase(std::remove(sinks.begin(), sinks.end(), file_sink), sinks.end());
            file_sink.reset();
        }
        if (filename.empty()) return;

        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }
};

std::shared_ptr<Logger> Logger::getInstance() {
    static std::shared_ptr<Logger> instance = std::make_shared<Logger>();
    return instance;
}

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::trace(const std::string& message) { impl_->logger->trace(message); }
void Logger::debug(const std::string& message) { impl_->logger->debug(message); }
void Logger::info(const std::string& message) { impl_->logger->info(message); }
void Logger::warning(const std::string& message) { impl_->logger->warn(message); }
void Logger::error(const std::string& message) { impl_->logger->error(message); }
void Logger::critical(const std::string& message) { impl_->logger->critical(message); }

void Logger::setLevel(LogLevel level) {
    impl_->setLevel(level);
}

LogLevel Logger::level() const {
    return impl_->currentLevel();
}

void Logger::setOutputFile(const std::string& filename) {
    impl_->setOutputFile(filename);
}

} // namespace biokg
