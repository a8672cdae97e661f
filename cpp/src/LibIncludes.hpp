// General index header
//
#ifndef __HAVE_LIBINCLUDES__
#define __HAVE_LIBINCLUDES__

/**
 * Set up the general-purpose library environment, mainly STL and boost
 * libraries.
 */

#include <string>
#include <vector>
#include <boost/function.hpp>
#include <boost/intrusive_ptr.hpp>
#include <boost/variant.hpp>

namespace dissolve
{

using std::string;
using std::vector;
using boost::function;

} // namespace dissolve

#endif // __HAVE_LIBINCLUDES__
