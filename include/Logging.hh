/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>

#include "IoUtility.hh"

namespace WarCheck {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Other events of importance, such as validation verdicts
    DEBUG     ///< Verbose debugging logging, such as each classified line
};

/// \cond DOXYGEN_IGNORE
/// These are helpers for implementing log()

namespace Impl {

bool shouldLog(LogLevel level);
std::ostream& logStream();

template<typename FormatIterator>
void log(FormatIterator first, FormatIterator last)
{
    if (first != last) {
        logStream() << std::addressof(*first);
    }
}

template<typename FormatIterator, typename First, typename... Rest>
void log(
    FormatIterator first, FormatIterator last, const First& arg,
    const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        log(first, iter);
    } else {
        logStream().write(std::addressof(*first), iter - first);
        // Bring the operator<< overloads of the WarCheck namespace (optionals,
        // variants) into consideration for arguments from other namespaces
        {
            using WarCheck::operator<<;
            logStream() << arg;
        }
        log(std::next(iter, 2), last, rest...);
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
 * \note The \p format string resembles the standard C formatting string, but
 * the type given by a specifier is ignored. Each argument in \p ts is
 * streamed as is to the stream set up with setupLogging(). Exactly one
 * character following the \% sign is consumed, so multi‐character specifiers
 * are not understood. Using a specifier that matches the type of the argument
 * (%%s, %%d) is encouraged.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values streamed to the placeholders in \p format
 */
template<typename String, typename... Ts>
void log(LogLevel level, const String& format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        Impl::log(std::begin(format), std::end(format), ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Mapping between verbosity and logging level
 *
 * Command line tools conventionally increase their verbosity each time -v is
 * given. This function maps the number of -v flags to a logging level.
 *
 * \param verbosity the verbosity level (the number of times -v flag is
 * given)
 *
 * \return LogLevel corresponding the verbosity (0 warning, 1 info, >=2 debug)
 */
LogLevel getLogLevel(int verbosity);

/** \brief Convert a name to logging level
 *
 * The accepted names are the lowercase names of the enumerators (“none”,
 * “fatal”, “error”, “warning”, “info” and “debug”).
 *
 * \param name the name of the level
 *
 * \return the level named by \p name, or none if \p name is not recognized
 */
std::optional<LogLevel> logLevelFromString(std::string_view name);

/** \brief Setup logging utility
 *
 * This function sets up the (global) minimum logging level and the stream to
 * which the log is output.
 *
 * If this method is not called, the default logging level is LogLevel::WARNING
 * and the default stream is std::cerr. If the logging level is set to
 * LogLevel::NONE, no logs are produced.
 *
 * The application must ensure that \p stream outlives all logging that takes
 * place before another stream is set up.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

/** \brief Output a LogLevel to stream
 *
 * \param os the output stream
 * \param level the level to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, LogLevel level);

}

#endif // LOGGING_HH_
