#pragma once
#include <iosfwd>
#include <string>

namespace leapmcp
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(LogLevel level);

/// Parses "DEBUG", "INFO", "WARNING"/"WARN" and "ERROR" (any case).
/// Unrecognized names map to Info.
LogLevel log_level_from_string(const std::string& name);

/// Diagnostic logger writing "[LEVEL] logger: message" lines to a sink.
///
/// The sink must never be the protocol output stream; the executable binds
/// it to stderr.
class Logger
{
  public:
    explicit Logger(std::ostream& sink, LogLevel min_level = LogLevel::Info,
                    std::string name = "leapmcp");

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

    bool enabled(LogLevel level) const
    {
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }
    LogLevel level() const
    {
        return min_level_;
    }
    const std::string& name() const
    {
        return name_;
    }

  private:
    std::ostream* sink_;
    LogLevel min_level_;
    std::string name_;
};

} // namespace leapmcp
