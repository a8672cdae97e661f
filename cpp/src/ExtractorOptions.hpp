#ifndef __HAVE_EXTRACTOR_OPTIONS__
#define __HAVE_EXTRACTOR_OPTIONS__

#include <iostream>
#include "LibIncludes.hpp"
#include "Log.hpp"

namespace dissolve
{

/**
 * Per-extractor settings
 */
struct ExtractorOptions
{
    ExtractorOptions()
        : encoding("UTF-8")
        , scriptingEnabled(true)
        , logLevel(LogLevel::Warning)
        , logStream(&std::cerr) {}

    // Charset of the input bytes. Passed to libhubbub as fixed, so <meta
    // charset> declarations in the document are not acted upon.
    string encoding;

    // With scripting on, <noscript> content is raw text and gets extracted
    // verbatim, tags included.
    bool scriptingEnabled;

    LogLevel logLevel;
    std::ostream* logStream;
};

} // namespace dissolve

#endif
