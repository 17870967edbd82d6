#pragma once

#include <memory>
#include <optional>
#include <string>

namespace biokg {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

/// Level for a name ("debug", "INFO", "warn", ...), or nullopt if unknown.
std::optional<LogLevel> findLogLevel(const std::string& name);

/// Like findLogLevel but unknown names map to INFO.
LogLevel parseLogLevel(const std::string& name);

/// Process-wide logger backed by spdlog.
/// Writes to stderr with color; optionally mirrors everything to a file.
class Logger {
public:
    static std::shared_ptr<Logger> getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Add a file sink at `filename` (truncated). Empty name removes it.
    void setOutputFile(const std::string& filename);

    Logger();
    ~Logger();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace biokg

#define BIOKG_LOG_TRACE(msg) ::biokg::Logger::getInstance()->trace(msg)
#define BIOKG_LOG_DEBUG(msg) ::biokg::Logger::getInstance()->debug(msg)
#define BIOKG_LOG_INFO(msg) ::biokg::Logger::getInstance()->info(msg)
#define BIOKG_LOG_WARNING(msg) ::biokg::Logger::getInstance()->warning(msg)
#define BIOKG_LOG_ERROR(msg) ::biokg::Logger::getInstance()->error(msg)
#define BIOKG_LOG_CRITICAL(msg) ::biokg::Logger::getInstance()->critical(msg)
