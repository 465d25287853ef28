#include "memory.hh"

namespace Bibsync
{

MemoryStats memory_stats[(size_t)MemoryDomain::Count] = {};

}
