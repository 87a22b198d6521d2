#include "tally/log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace Ballot::Tally {

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_sink(std::ostream* sink)
{
    std::lock_guard lock(mutex_);
    sink_ = sink;
}

std::string_view Logger::level_name(Level level)
{
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    default:
        return "OFF";
    }
}

void Logger::log(Level level, std::string_view message)
{
    if (level == Level::Off || !is_enabled(level)) {
        return;
    }

    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf {};
    gmtime_r(&now, &tm_buf);

    std::lock_guard lock(mutex_);
    std::ostream& out = sink_ != nullptr ? *sink_ : std::cerr;
    out << '[' << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ") << "] ["
        << level_name(level) << "] " << message << '\n';
}

} // namespace Ballot::Tally
