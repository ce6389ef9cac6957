#pragma once

#include <string>

namespace fastnet {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static void initialize();
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    /**
     * Toggle all output. Disabled loggers drop every message regardless of level.
     */
    static void enable();
    static void disable();
    static bool isEnabled();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    /**
     * Prefix added after the level marker, e.g. "[INFO] [FastNet] ...".
     * An empty tag removes the prefix.
     */
    static void setTag(const std::string& tag);
    static std::string getTag();

    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);
    static std::string levelName(LogLevel level);

private:
    static void write(LogLevel level, const std::string& message);

    static bool initialized_;
};

} // namespace utils
} // namespace fastnet
