#ifndef memory_hh_INCLUDED
#define memory_hh_INCLUDED

#include <cstddef>
#include <new>
#include <utility>

#include "assert.hh"
#include "meta.hh"

namespace Bibsync
{

enum class MemoryDomain
{
    Undefined,
    String,
    Document,
    Selectors,
    NodeState,
    Citations,
    Entities,
    Labels,
    Options,
    Events,
    Watchers,
    Count
};

struct MemoryStats
{
    size_t allocated_bytes;
    size_t allocation_count;
};

extern MemoryStats memory_stats[(size_t)MemoryDomain::Count];

inline void on_alloc(MemoryDomain domain, size_t size)
{
    auto& stats = memory_stats[(int)domain];
    stats.allocated_bytes += size;
    ++stats.allocation_count;
}

inline void on_dealloc(MemoryDomain domain, size_t size)
{
    auto& stats = memory_stats[(int)domain];
    bib_assert(stats.allocated_bytes >= size);
    stats.allocated_bytes -= size;
    --stats.allocation_count;
}

template<typename T, MemoryDomain domain>
struct Allocator
{
    using value_type = T;

    Allocator() = default;
    template<typename U>
    Allocator(const Allocator<U, domain>&) {}

    template<typename U>
    struct rebind { using other = Allocator<U, domain>; };

    T* allocate(size_t n)
    {
        size_t size = sizeof(T) * n;
        on_alloc(domain, size);
        return reinterpret_cast<T*>(::operator new(size));
    }

    void deallocate(T* ptr, size_t n)
    {
        size_t size = sizeof(T) * n;
        on_dealloc(domain, size);
        ::operator delete(ptr);
    }
};

template<typename T1, MemoryDomain d1, typename T2, MemoryDomain d2>
constexpr bool operator==(const Allocator<T1, d1>&, const Allocator<T2, d2>&)
{
    return d1 == d2;
}

constexpr MemoryDomain memory_domain(Meta::AnyType) { return MemoryDomain::Undefined; }

template<typename T>
constexpr decltype(T::Domain) memory_domain(Meta::Type<T>) { return T::Domain; }

// Types allocated on their own (nodes, records) inherit this
// so that new/delete are accounted in their domain
template<MemoryDomain d>
struct UseMemoryDomain
{
    static constexpr MemoryDomain Domain = d;

    static void* operator new(size_t size)
    {
        on_alloc(Domain, size);
        return ::operator new(size);
    }

    static void operator delete(void* ptr, size_t size)
    {
        on_dealloc(Domain, size);
        ::operator delete(ptr);
    }
};

}

#endif // memory_hh_INCLUDED
