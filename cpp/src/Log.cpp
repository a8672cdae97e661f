#include "Log.hpp"

namespace dissolve
{

const char* logLevelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    case LogLevel::None:
    default:
        break;
    }
    return "none";
}

void Log::write(LogLevel level, const string& message) const
{
    if (!enabled(level)) {
        return;
    }
    (*out) << "dissolve " << logLevelName(level) << ": " << message << std::endl;
}

} // namespace dissolve
