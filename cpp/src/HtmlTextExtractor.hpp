#ifndef __HAVE_HTML_TEXT_EXTRACTOR__
#define __HAVE_HTML_TEXT_EXTRACTOR__

#include "LibIncludes.hpp"
#include "ExtractorOptions.hpp"
#include "Log.hpp"

namespace dissolve {

typedef function<void( const string& )> TextReceiver;

/**
 * The main extraction setup class
 *
 * Each call parses one complete document with a fresh parser and sink, so
 * an extractor can be reused and carries no state between calls.
 */
class HtmlTextExtractor {
    public:
        explicit HtmlTextExtractor( const ExtractorOptions& options = ExtractorOptions() );

        void extract( const string& input, TextReceiver receiver );
        // Overloaded sync version
        string extract( const string& input );

        const ExtractorOptions& options() const {
            return opts;
        }

    private:
        ExtractorOptions opts;
        Log log;
};

/**
 * Text content of an HTML5 document in document order, with default
 * options. Tags, attributes, comments and doctypes are dropped; malformed
 * markup is recovered rather than reported.
 */
string stripHtmlTags( const string& input );

} // namespace dissolve

#endif
