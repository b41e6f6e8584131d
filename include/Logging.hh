/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <functional>
#include <iterator>
#include <memory>
#include <ostream>
#include <sstream>
#include <string_view>

#include "IoUtility.hh"

namespace Whoopie {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Other events of importance
    DEBUG     ///< Verbose debugging logging
};

/** \brief Log handler
 *
 * A log handler receives every log record that passes the level filter. The
 * message is fully formatted but carries no timestamp or level prefix.
 *
 * \sa setupLogging(LogLevel, LogHandler)
 */
using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// \cond DOXYGEN_IGNORE
/// These are helpers for implementing log()

namespace Impl {

bool shouldLog(LogLevel level);
void dispatch(LogLevel level, std::string_view message);

template<typename FormatIterator>
void format(std::ostream& os, FormatIterator first, FormatIterator last)
{
    std::copy(first, last, std::ostreambuf_iterator<char>(os));
}

template<typename FormatIterator, typename First, typename... Rest>
void format(
    std::ostream& os, FormatIterator first, FormatIterator last,
    const First& arg, const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        format(os, first, iter);
    } else {
        format(os, first, iter);
        {
            using Whoopie::operator<<;
            os << arg;
        }
        format(os, std::next(iter, 2), last, rest...);
    }
}

}

/// \endcond

/** \brief Logging utility
 *
 * Log message if \p level is at least the minimum logging level set by
 * setupLogging().
 *
 * \note This utility is not thread safe. Only one thread should log at a
 * time.
 *
 * \note The \p format string is inspired by the standard C formatting
 * string. However, the implementation ignores the actual type specified by the
 * format specifiers, and instead the \p ts are streamed as is. Multi‐character
 * specifiers are not understood and exactly one character following the \%
 * sign is always ignored.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values streamed to the placeholders in \p format
 */
template<typename String, typename... Ts>
void log(LogLevel level, const String& format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        const auto format_view = std::string_view {format};
        auto os = std::ostringstream {};
        Impl::format(os, format_view.begin(), format_view.end(), ts...);
        Impl::dispatch(level, os.str());
    }
}

/** \brief Default mapping between verbosity and logging level
 *
 * \param verbosity the verbosity level (typically the number of times -v flag
 * is given)
 *
 * \return LogLevel corresponding the verbosity (0 warning, 1 info, >=2 debug)
 */
LogLevel getLogLevel(int verbosity);

/** \brief Setup logging to a stream
 *
 * Log records are written to \p stream one per line, prefixed with local time
 * and the level name.
 *
 * If logging is never set up, the default logging level is LogLevel::WARNING
 * and the default stream is std::cerr. If the logging level is set to
 * LogLevel::NONE, no logs are produced.
 *
 * The application is responsible for ensuring that no logging takes place after
 * the lifetime of \p stream has ended until another sink has been set up.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

/** \brief Setup logging to a handler
 *
 * This overload lets the host of the engine inject its own log sink.
 *
 * \param level the minimum logging level that causes log to be output
 * \param handler the function invoked for each log record
 */
void setupLogging(LogLevel level, LogHandler handler);

/** \brief Output a LogLevel to stream
 */
std::ostream& operator<<(std::ostream& os, LogLevel level);

}

#endif // LOGGING_HH_
