#include "core/logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (file_.is_open()) {
        file_ << timestamp() << " --- log closed ---\n";
        file_.close();
    }
}

// Opens (appends to) the log file, creating its directory first
bool Logger::open(const std::string& filename) {
    std::filesystem::path path(filename);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            warn("Logger", "cannot create log directory " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    file_.open(filename, std::ios_base::app);
    if (!file_.is_open()) {
        std::cerr << timestamp() << " [Logger] [WARN] cannot open log file " << filename
                  << ", logging to stderr only" << std::endl;
        return false;
    }
    file_ << timestamp() << " --- log opened ---\n";
    return true;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::debug(const std::string& tag, const std::string& message) { log(LogLevel::Debug, tag, message); }
void Logger::info(const std::string& tag, const std::string& message) { log(LogLevel::Info, tag, message); }
void Logger::warn(const std::string& tag, const std::string& message) { log(LogLevel::Warn, tag, message); }
void Logger::error(const std::string& tag, const std::string& message) { log(LogLevel::Error, tag, message); }

void Logger::log(LogLevel level, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) return;

    const std::string line = timestamp() + " [" + tag + "] [" + levelName(level) + "] " + message + "\n";
    std::cerr << line;
    if (file_.is_open()) {
        file_ << line;
        if (level >= LogLevel::Warn) file_.flush();
    }
}

std::string Logger::timestamp() const {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&now_c, &local_tm);

    char buff[32];
    std::strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S", &local_tm);
    return buff;
}
