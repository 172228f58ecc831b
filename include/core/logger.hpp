#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <mutex>
#include <optional>
#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error };

std::optional<LogLevel> parseLogLevel(const std::string& name);

// Process-wide logger. Lines go to stderr and, once open() succeeded, to
// the log file as well.
class Logger {
public:
    static Logger& instance();

    bool open(const std::string& filename);
    void setLevel(LogLevel level);
    LogLevel level() const;

    void debug(const std::string& tag, const std::string& message);
    void info(const std::string& tag, const std::string& message);
    void warn(const std::string& tag, const std::string& message);
    void error(const std::string& tag, const std::string& message);

    void log(LogLevel level, const std::string& tag, const std::string& message);

    ~Logger();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string timestamp() const;

    mutable std::mutex mutex_;
    std::ofstream file_;
    LogLevel level_ = LogLevel::Info;
};

#endif
