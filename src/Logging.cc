#include "Logging.hh"

#include <array>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string_view>

namespace Trio {

namespace {

auto logStreamRef = std::ref(std::cerr);
auto minimumLevel = LogLevel::WARNING;

using namespace std::string_view_literals;

// Indexed by LogLevel
constexpr auto LEVEL_TAGS = std::array {
    ""sv, "FATAL   "sv, "ERROR   "sv, "WARNING "sv, "INFO    "sv, "DEBUG   "sv,
};

}

namespace Impl {

bool shouldLog(LogLevel level)
{
    if (level == LogLevel::NONE || level > minimumLevel) {
        return false;
    }
    const auto now = std::time(nullptr);
    logStream() << std::put_time(std::localtime(&now), "%c ")
        << LEVEL_TAGS[static_cast<std::size_t>(level)];
    return true;
}

std::ostream& logStream()
{
    return logStreamRef;
}

}

LogLevel getLogLevel(int verbosity)
{
    if (verbosity <= 0) {
        return LogLevel::WARNING;
    }
    return verbosity == 1 ? LogLevel::INFO : LogLevel::DEBUG;
}

void setupLogging(LogLevel level, std::ostream& stream)
{
    minimumLevel = level;
    logStreamRef = stream;
}

}
