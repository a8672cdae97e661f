#ifndef __HAVE_ERRORS__
#define __HAVE_ERRORS__

#include <stdexcept>
#include "LibIncludes.hpp"

namespace dissolve
{

/**
 * The tree builder asked for something its callback contract rules out,
 * e.g. the name of a non-element node or an insert-before-sibling.
 * Continuing could silently misorder the output, so this is never caught
 * inside the library.
 */
class ContractViolation
    : public std::logic_error
{
public:
    explicit ContractViolation(const string& what)
        : std::logic_error(what) {}
};

/**
 * libhubbub failed for a reason unrelated to the markup (bad encoding name,
 * out of memory). Malformed markup never ends up here.
 */
class ParserError
    : public std::runtime_error
{
public:
    ParserError(const string& operation, int code, const string& description)
        : std::runtime_error(operation + " failed: " + description)
        , errorCode(code) {}

    // The hubbub_error value
    int code() const {
        return errorCode;
    }

private:
    int errorCode;
};

} // namespace dissolve

#endif
