#pragma once

#include <string>
#include <memory>

namespace docflow {

struct LoggingConfig;

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

// Parses "trace".."critical" (case-insensitive); unknown names map to INFO
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static std::shared_ptr<Logger> getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;
    void set_output_file(const std::string& filename);

    Logger();
    ~Logger();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Applies level and file sink from configuration
void initialize_logging(const LoggingConfig& config);

} // namespace docflow

// Convenience macros
#define DOCFLOW_LOG_TRACE(msg) docflow::Logger::getInstance()->trace(msg)
#define DOCFLOW_LOG_DEBUG(msg) docflow::Logger::getInstance()->debug(msg)
#define DOCFLOW_LOG_INFO(msg) docflow::Logger::getInstance()->info(msg)
#define DOCFLOW_LOG_WARNING(msg) docflow::Logger::getInstance()->warning(msg)
#define DOCFLOW_LOG_ERROR(msg) docflow::Logger::getInstance()->error(msg)
#define DOCFLOW_LOG_CRITICAL(msg) docflow::Logger::getInstance()->critical(msg)
