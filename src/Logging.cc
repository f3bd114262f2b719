#include "Logging.hh"

#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>

namespace WarCheck {

using namespace std::string_view_literals;

namespace {

auto globalLoggingStream = std::ref(std::cerr);
auto globalLoggingLevel = LogLevel::WARNING;

const std::map<LogLevel, std::string_view> LEVEL_NAMES {
    { LogLevel::NONE,    "none"sv },
    { LogLevel::FATAL,   "fatal"sv },
    { LogLevel::ERROR,   "error"sv },
    { LogLevel::WARNING, "warning"sv },
    { LogLevel::INFO,    "info"sv },
    { LogLevel::DEBUG,   "debug"sv },
};

}

namespace Impl {

bool shouldLog(LogLevel level)
{
    static const std::map<LogLevel, std::string_view> LEVEL_PREFIXES {
        { LogLevel::FATAL,   "FATAL   "sv },
        { LogLevel::ERROR,   "ERROR   "sv },
        { LogLevel::WARNING, "WARNING "sv },
        { LogLevel::INFO,    "INFO    "sv },
        { LogLevel::DEBUG,   "DEBUG   "sv },
    };

    if (level != LogLevel::NONE && level <= globalLoggingLevel) {
        const auto time = std::time(nullptr);
        logStream() << std::put_time(std::localtime(&time), "%c ") <<
            LEVEL_PREFIXES.at(level);
        return true;
    }
    return false;
}

std::ostream& logStream()
{
    return globalLoggingStream;
}

}

LogLevel getLogLevel(int verbosity)
{
    if (verbosity >= 2) {
        return LogLevel::DEBUG;
    } else if (verbosity == 1) {
        return LogLevel::INFO;
    }
    return LogLevel::WARNING;
}

std::optional<LogLevel> logLevelFromString(const std::string_view name)
{
    for (const auto& [level, level_name] : LEVEL_NAMES) {
        if (level_name == name) {
            return level;
        }
    }
    return std::nullopt;
}

void setupLogging(LogLevel level, std::ostream& stream)
{
    globalLoggingLevel = level;
    globalLoggingStream = stream;
}

std::ostream& operator<<(std::ostream& os, const LogLevel level)
{
    return os << LEVEL_NAMES.at(level);
}

}
