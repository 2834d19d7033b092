/** \file
 *
 * \brief Logging facility of the Trio server
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <memory>
#include <ostream>

#include "IoUtility.hh"

namespace Trio {

/** \brief Severity of a log message
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< Logging disabled
    FATAL,    ///< The server cannot continue
    ERROR,    ///< A request or callback failed but the server keeps running
    WARNING,  ///< Something unexpected, like an unreachable client
    INFO,     ///< Lifecycle of the server, rooms and games
    DEBUG     ///< Every command and rejected action
};

/// \cond DOXYGEN_IGNORE

namespace Impl {

bool shouldLog(LogLevel level);
std::ostream& logStream();

template<typename FormatIterator>
void log(FormatIterator first, FormatIterator last)
{
    if (first != last) {
        logStream().write(std::addressof(*first), last - first);
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
        // Makes the operator<< overloads of the Trio namespace (optional,
        // variant) visible for arguments from the std namespace
        {
            using Trio::operator<<;
            logStream() << arg;
        }
        log(std::next(iter, 2), last, rest...);
    }
}

}

/// \endcond

/** \brief Write a log message
 *
 * The message is written if \p level is at most as verbose as the level set
 * with setupLogging(). Each message is prefixed by the local time and the
 * level, and terminated by a newline.
 *
 * The \p format string uses \c printf style placeholders, but the character
 * following \c % is only a hint for the reader: each placeholder is replaced
 * by the next argument written with \c operator<<.
 *
 * \note Not thread safe. The server logs only from the message loop thread.
 *
 * \param level the severity of the message
 * \param format the format string
 * \param ts the arguments substituted for the placeholders
 */
template<typename String, typename... Ts>
void log(LogLevel level, const String& format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        Impl::log(std::begin(format), std::end(format), ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Map the number of -v flags to a log level
 *
 * \param verbosity the number of times -v was given
 *
 * \return LogLevel::WARNING for zero, LogLevel::INFO for one and
 * LogLevel::DEBUG for more
 */
LogLevel getLogLevel(int verbosity);

/** \brief Set the minimum log level and the log stream
 *
 * The defaults are LogLevel::WARNING and \c std::cerr. LogLevel::NONE turns
 * logging off. \p stream must outlive any logging done before the next call.
 *
 * \param level the least severe level that is still written
 * \param stream the stream log messages are written to
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
