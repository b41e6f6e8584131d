#include "Logging.hh"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <utility>

namespace Whoopie {

namespace {

LogHandler makeStreamHandler(std::ostream& stream)
{
    return [&stream](const LogLevel level, const std::string_view message)
    {
        using namespace std::string_view_literals;
        static const std::map<LogLevel, std::string_view> LEVEL_PREFIXES {
            { LogLevel::FATAL,   "FATAL   "sv },
            { LogLevel::ERROR,   "ERROR   "sv },
            { LogLevel::WARNING, "WARNING "sv },
            { LogLevel::INFO,    "INFO    "sv },
            { LogLevel::DEBUG,   "DEBUG   "sv },
        };
        const auto time = std::time(nullptr);
        stream << std::put_time(std::localtime(&time), "%c ") <<
            LEVEL_PREFIXES.at(level) << message << '\n';
    };
}

auto globalLoggingLevel = LogLevel::WARNING;
auto globalLogHandler = makeStreamHandler(std::cerr);

}

namespace Impl {

bool shouldLog(LogLevel level)
{
    return level != LogLevel::NONE && level <= globalLoggingLevel &&
        globalLogHandler;
}

void dispatch(LogLevel level, std::string_view message)
{
    globalLogHandler(level, message);
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

void setupLogging(LogLevel level, std::ostream& stream)
{
    globalLoggingLevel = level;
    globalLogHandler = makeStreamHandler(stream);
}

void setupLogging(LogLevel level, LogHandler handler)
{
    globalLoggingLevel = level;
    globalLogHandler = std::move(handler);
}

std::ostream& operator<<(std::ostream& os, const LogLevel level)
{
    static const std::map<LogLevel, const char*> LEVEL_NAMES {
        { LogLevel::NONE,    "none"    },
        { LogLevel::FATAL,   "fatal"   },
        { LogLevel::ERROR,   "error"   },
        { LogLevel::WARNING, "warning" },
        { LogLevel::INFO,    "info"    },
        { LogLevel::DEBUG,   "debug"   },
    };
    return os << LEVEL_NAMES.at(level);
}

}
