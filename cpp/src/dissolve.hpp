// General index header
//
#ifndef __HAVE_DISSOLVE__
#define __HAVE_DISSOLVE__

#include "LibIncludes.hpp"

#include "Errors.hpp"
#include "Log.hpp"
#include "Node.hpp"
#include "TreeSink.hpp"
#include "TextSink.hpp"
#include "ExtractorOptions.hpp"
#include "TreeBuilder_Hubbub.hpp"
#include "HtmlTextExtractor.hpp"

#endif
