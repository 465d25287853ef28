#ifndef unordered_map_hh_INCLUDED
#define unordered_map_hh_INCLUDED

#include "hash.hh"
#include "memory.hh"

#include <unordered_map>
#include <unordered_set>

namespace Bibsync
{

template<typename Key, typename Value, MemoryDomain domain = memory_domain(Meta::Type<Key>{})>
using UnorderedMap = std::unordered_map<Key, Value, Hash<Key>, std::equal_to<Key>,
                                        Allocator<std::pair<const Key, Value>, domain>>;

template<typename Key, MemoryDomain domain = memory_domain(Meta::Type<Key>{})>
using UnorderedSet = std::unordered_set<Key, Hash<Key>, std::equal_to<Key>,
                                        Allocator<Key, domain>>;

}

#endif // unordered_map_hh_INCLUDED
