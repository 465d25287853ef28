#ifndef safe_ptr_hh_INCLUDED
#define safe_ptr_hh_INCLUDED

#include "assert.hh"
#include "ref_ptr.hh"

namespace Bibsync
{

// *** SafePtr: objects that assert nobody references them when they die ***
//
// Used for the non owning handles a session keeps on the host
// document and entity store.
class SafeCountable
{
public:
#ifdef BIB_DEBUG
    SafeCountable() {}
    ~SafeCountable()
    {
        bib_assert(m_count == 0);
    }

    SafeCountable(const SafeCountable&) {}
    SafeCountable(SafeCountable&&) {}

    SafeCountable& operator=(const SafeCountable&) { return *this; }
    SafeCountable& operator=(SafeCountable&&) { return *this; }

    int safe_ref_count() const { return m_count; }

private:
    friend struct SafeCountablePolicy;
    mutable int m_count = 0;
#endif
};

struct SafeCountablePolicy
{
#ifdef BIB_DEBUG
    static void inc_ref(const SafeCountable* sc) noexcept { ++sc->m_count; }
    static void dec_ref(const SafeCountable* sc) noexcept { --sc->m_count; }
#else
    static void inc_ref(const SafeCountable*) noexcept {}
    static void dec_ref(const SafeCountable*) noexcept {}
#endif
};

template<typename T>
using SafePtr = RefPtr<T, SafeCountablePolicy>;

}

#endif // safe_ptr_hh_INCLUDED
