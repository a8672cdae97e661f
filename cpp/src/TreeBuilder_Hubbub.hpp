#ifndef __HAVE_TREEBUILDER_HUBBUB__
#define __HAVE_TREEBUILDER_HUBBUB__

#include <boost/noncopyable.hpp>
#include "LibIncludes.hpp"
#include "TreeSink.hpp"
#include "ExtractorOptions.hpp"
#include "Log.hpp"

struct hubbub_parser;

namespace dissolve
{


class TreeBuilderHandler;

/**
 * Runs libhubbub's HTML5 tokenizer and tree builder over one complete
 * document, reporting tree construction to a TreeSink.
 *
 * One instance parses one document. The sink must outlive it: libhubbub
 * releases its node handles when the parser is destroyed.
 */
class TreeBuilder_Hubbub
    : private boost::noncopyable
{
public:
    TreeBuilder_Hubbub(TreeSink& sink, const ExtractorOptions& options, const Log& log);
    ~TreeBuilder_Hubbub();

    // Feed the whole input and signal end of file. Rethrows whatever the
    // sink threw from inside a callback.
    void parse(const string& input);

    // The root handle obtained from the sink
    NodePtr document() const;

private:
    void destroy();

    hubbub_parser* hubbubParser;
    TreeBuilderHandler* handler;
    Log log;
    bool completed;
};


}

#endif
