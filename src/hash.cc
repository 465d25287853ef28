#include "hash.hh"

#include "assert.hh"
#include "unit_tests.hh"

#include <cstdint>

namespace Bibsync
{

// 64 bit FNV-1a, node ids and rids are short so this beats anything fancier
size_t hash_data(const char* input, size_t len)
{
    constexpr uint64_t offset_basis = 0xcbf29ce484222325;
    constexpr uint64_t prime = 0x100000001b3;

    uint64_t hash = offset_basis;
    for (size_t i = 0; i < len; ++i)
    {
        hash ^= (unsigned char)input[i];
        hash *= prime;
    }
    return (size_t)hash;
}

UnitTest test_fnv_hash{[] {
    bib_assert(hash_data("", 0) == (size_t)0xcbf29ce484222325);
    bib_assert(hash_data("a", 1) == (size_t)0xaf63dc4c8601ec8c);
    bib_assert(hash_data("xref", 4) != hash_data("xreg", 4));
}};

}
