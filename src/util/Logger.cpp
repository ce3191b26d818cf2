#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace gitquery {

bool Logger::parseLevel(const std::string& text, LogLevel& out) {
    if (text == "debug" || text == "3") { out = LogLevel::Debug; return true; }
    if (text == "info" || text == "2") { out = LogLevel::Info; return true; }
    if (text == "warn" || text == "1") { out = LogLevel::Warn; return true; }
    if (text == "error" || text == "0") { out = LogLevel::Error; return true; }
    return false;
}

static LogLevel levelFromEnvironment() {
    LogLevel level = LogLevel::Info;
    const char* env = std::getenv("GITQUERY_LOG");
    if (env && !Logger::parseLevel(env, level)) {
        std::cerr << "[warn ] ignoring unknown GITQUERY_LOG value '" << env << "'\n";
    }
    return level;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(levelFromEnvironment()) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::write(LogLevel level, const char* tag, const std::string& msg) const {
    if (!enabled(level)) return;
    std::cerr << tag << ' ' << msg << '\n';
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, "[error]", msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, "[warn ]", msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, "[info ]", msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, "[debug]", msg); }

}
