#pragma once

#include <string>

namespace gitquery {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Initial level comes from the GITQUERY_LOG environment variable and can be
 * overridden with `--log-level` on the command line. All output goes to
 * stderr so that decoded records written to stdout stay machine-readable.
 */
class Logger {
public:
    static Logger& instance();

    /// Parse "error" | "warn" | "info" | "debug" or "0".."3"; false if unknown
    static bool parseLevel(const std::string& text, LogLevel& out);

    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const { return currentLevel >= level; }

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void write(LogLevel level, const char* tag, const std::string& msg) const;
    LogLevel currentLevel;
};

}
