#ifndef __HAVE_LOG__
#define __HAVE_LOG__

#include <iostream>
#include <sstream>
#include <utility>
#include "LibIncludes.hpp"

namespace dissolve
{

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    None,
};

const char* logLevelName(LogLevel level);

class LogLine;

/**
 * Level-filtered diagnostics, written line by line to a stream (std::cerr
 * unless configured otherwise).
 *
 *     log.at(LogLevel::Debug) << "parse error: " << message;
 */
class Log
{
public:
    explicit Log(LogLevel threshold = LogLevel::Warning,
                 std::ostream* stream = &std::cerr)
        : threshold(threshold)
        , out(stream) {}

    bool enabled(LogLevel level) const {
        return out != nullptr
            && level != LogLevel::None
            && level >= threshold;
    }

    void write(LogLevel level, const string& message) const;

    // One message at `level`, written when the returned line goes away
    LogLine at(LogLevel level) const;

    LogLevel level() const {
        return threshold;
    }

private:
    LogLevel threshold;
    std::ostream* out;
};

/**
 * Collects one message and hands it to the Log at the end of the full
 * expression. Nothing is formatted for a disabled level.
 */
class LogLine
{
public:
    LogLine(const Log& log, LogLevel level)
        : log(log)
        , level(level)
        , active(log.enabled(level)) {}

    LogLine(LogLine&& other)
        : log(other.log)
        , level(other.level)
        , active(other.active)
        , buffer(std::move(other.buffer))
    {
        other.active = false;
    }

    ~LogLine() {
        if (active) {
            log.write(level, buffer.str());
        }
    }

    template<class T>
    LogLine& operator<<(const T& value) {
        if (active) {
            buffer << value;
        }
        return *this;
    }

private:
    LogLine(const LogLine&);
    LogLine& operator=(const LogLine&);

    const Log& log;
    LogLevel level;
    bool active;
    std::ostringstream buffer;
};

inline LogLine Log::at(LogLevel level) const
{
    return LogLine(*this, level);
}

} // namespace dissolve

#endif
