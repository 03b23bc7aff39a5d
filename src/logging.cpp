#include "leapmcp/logging.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <utility>

namespace leapmcp
{

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

LogLevel log_level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

Logger::Logger(std::ostream& sink, LogLevel min_level, std::string name)
    : sink_(&sink), min_level_(min_level), name_(std::move(name))
{
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (!enabled(level))
        return;
    *sink_ << "[" << to_string(level) << "] " << name_ << ": " << message << std::endl;
}

} // namespace leapmcp
