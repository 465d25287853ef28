#ifndef debug_hh_INCLUDED
#define debug_hh_INCLUDED

#include "enum.hh"
#include "flags.hh"

#include <functional>

namespace Bibsync
{

class StringView;

enum class DebugFlags
{
    None      = 0,
    Classify  = 1 << 0,
    Recompute = 1 << 1,
    Reconcile = 1 << 2,
};

constexpr bool with_bit_ops(Meta::Type<DebugFlags>) { return true; }

constexpr auto enum_desc(Meta::Type<DebugFlags>)
{
    return make_array<EnumDesc<DebugFlags>>({
        { DebugFlags::Classify, "classify" },
        { DebugFlags::Recompute, "recompute" },
        { DebugFlags::Reconcile, "reconcile" },
    });
}

// Where debug messages end up, the host usually forwards them
// to its own log; without a sink they go to stderr.
using DebugSink = std::function<void (StringView)>;

DebugSink set_debug_sink(DebugSink sink);

void write_to_debug_buffer(StringView str);

}

#endif // debug_hh_INCLUDED
