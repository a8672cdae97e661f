#include "Log.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace dissolve;

// Helper: streams a value and counts how often it was formatted
struct Counted {
    int* count;
};

static std::ostream& operator<<(std::ostream& out, const Counted& value) {
    ++*value.count;
    return out << "counted";
}

// ============================================================================
// Level filtering
// ============================================================================

TEST(Log, WritesAtOrAboveTheThreshold) {
    std::ostringstream out;
    Log log(LogLevel::Info, &out);

    log.at(LogLevel::Debug) << "hidden";
    log.at(LogLevel::Info) << "shown " << 1;
    log.at(LogLevel::Error) << "also shown";

    EXPECT_EQ(out.str(), "dissolve info: shown 1\ndissolve error: also shown\n");
}

TEST(Log, NoneDisablesEverything) {
    std::ostringstream out;
    Log log(LogLevel::None, &out);

    EXPECT_FALSE(log.enabled(LogLevel::Error));
    log.at(LogLevel::Error) << "dropped";
    log.at(LogLevel::None) << "dropped";
    EXPECT_EQ(out.str(), "");
}

TEST(Log, NullStreamDisablesEverything) {
    Log log(LogLevel::Debug, nullptr);
    EXPECT_FALSE(log.enabled(LogLevel::Error));
    log.at(LogLevel::Error) << "dropped";
}

TEST(Log, DisabledLinesAreNotFormatted) {
    std::ostringstream out;
    Log log(LogLevel::Warning, &out);
    int count = 0;

    log.at(LogLevel::Debug) << Counted{&count};
    EXPECT_EQ(count, 0);

    log.at(LogLevel::Warning) << Counted{&count};
    EXPECT_EQ(count, 1);
    EXPECT_EQ(out.str(), "dissolve warning: counted\n");
}

// ============================================================================
// Line lifetime
// ============================================================================

TEST(Log, MovedLineIsWrittenOnce) {
    std::ostringstream out;
    Log log(LogLevel::Debug, &out);
    {
        LogLine first = log.at(LogLevel::Debug);
        first << "one";
        LogLine second(std::move(first));
        second << " line";
    }
    EXPECT_EQ(out.str(), "dissolve debug: one line\n");
}
