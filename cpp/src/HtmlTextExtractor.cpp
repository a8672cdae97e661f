#include "HtmlTextExtractor.hpp"
#include "TextSink.hpp"
#include "TreeBuilder_Hubbub.hpp"

namespace dissolve {

HtmlTextExtractor::HtmlTextExtractor( const ExtractorOptions& options )
    : opts( options )
    , log( options.logLevel, options.logStream )
{}

string HtmlTextExtractor::extract( const string& input ) {
    string text;
    auto setText = [&] ( const string& value ) { text = value; };
    extract( input, setText );
    return text;
}

void HtmlTextExtractor::extract( const string& input, TextReceiver receiver ) {
    TextSink sink( log );

    try {
        // The parser goes away before the sink is finished: destroying it
        // drops libhubbub's remaining node handles
        TreeBuilder_Hubbub treeBuilder( sink, opts, log );
        treeBuilder.parse( input );
    } catch ( const std::exception& e ) {
        log.at( LogLevel::Error ) << "extraction failed: " << e.what();
        throw;
    }

    receiver( sink.finish() );
}

string stripHtmlTags( const string& input ) {
    HtmlTextExtractor extractor;
    return extractor.extract( input );
}

}
