#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace savekeeper {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    // log_file_path may be empty (console only). The file is opened in append mode.
    static void init(LogLevel level, const std::string& log_file_path = "");
    static void shutdown();
    static void log(LogLevel level, const std::string& message);

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warn(const std::string& message) { log(LogLevel::WARN, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }

    static void set_level(LogLevel level);
    static LogLevel level();

    // Console output can be muted for CLI commands; the log file still receives everything
    static void set_console_enabled(bool enabled);

    // "debug", "info", "warn", "error" (case-insensitive); unknown strings map to INFO
    static LogLevel parse_level(const std::string& name);

private:
    static LogLevel current_level;
    static bool console_enabled;
    static std::ofstream log_file;
    static std::mutex log_mutex;
};

} // namespace savekeeper
