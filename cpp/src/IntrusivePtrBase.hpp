#ifndef __HAVE_INTRUSIVEPTRBASE_HPP__
#define __HAVE_INTRUSIVEPTRBASE_HPP__

#include <cassert>
#include <boost/checked_delete.hpp>
#include <boost/intrusive_ptr.hpp>

namespace dissolve
{

/**
 * Reference count for objects shared through boost::intrusive_ptr.
 *
 * The counter is a plain integer. A handle is only touched by the thread
 * running its parse, and libhubbub's ref_node / unref_node callbacks adjust
 * the same counter that intrusive_ptr copies do.
 */
template<class T>
class IntrusivePtrBase
{
public:
    IntrusivePtrBase(): refCount(0) {}

    // A copy is a distinct object, so it starts without owners
    IntrusivePtrBase(IntrusivePtrBase<T> const&)
        : refCount(0) {}

    // Assignment never transfers the count
    IntrusivePtrBase& operator=(IntrusivePtrBase const&)
    {
        return *this;
    }

    friend void intrusive_ptr_add_ref(IntrusivePtrBase<T> const* s)
    {
        assert(s != 0);
        assert(s->refCount >= 0);
        ++s->refCount;
    }

    friend void intrusive_ptr_release(IntrusivePtrBase<T> const* s)
    {
        assert(s != 0);
        assert(s->refCount > 0);
        if (--s->refCount == 0)
            boost::checked_delete(static_cast<T const*>(s));
    }

    long refcount() const
    {
        return refCount;
    }

protected:
    ~IntrusivePtrBase() {}

private:
    ///should be modifiable even from const intrusive_ptr objects
    mutable long refCount;
};

} // namespace dissolve

#endif // __HAVE_INTRUSIVEPTRBASE_HPP__
