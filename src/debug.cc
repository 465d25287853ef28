#include "debug.hh"

#include "string.hh"
#include "unit_tests.hh"
#include "vector.hh"

#include <cerrno>
#include <unistd.h>

namespace Bibsync
{

static DebugSink& debug_sink()
{
    static DebugSink sink;
    return sink;
}

DebugSink set_debug_sink(DebugSink sink)
{
    return std::exchange(debug_sink(), std::move(sink));
}

static void write_stderr(StringView str)
{
    const char* data = str.data();
    int count = str.length();
    while (count > 0)
    {
        ssize_t written = ::write(STDERR_FILENO, data, (size_t)count);
        if (written == -1 and errno == EINTR)
            continue;
        if (written <= 0)
            return;
        data += written;
        count -= (int)written;
    }
}

void write_to_debug_buffer(StringView str)
{
    if (auto& sink = debug_sink())
    {
        sink(str);
        return;
    }

    write_stderr(str);
    if (str.empty() or str.back() != '\n')
        write_stderr("\n");
}

UnitTest test_debug_sink{[]{
    Vector<String> lines;
    auto previous = set_debug_sink([&](StringView line) { lines.emplace_back(line); });
    write_to_debug_buffer("recompute: 3 markers");
    set_debug_sink(std::move(previous));

    bib_assert(lines.size() == 1 and lines[0] == "recompute: 3 markers");
    bib_assert(enum_name(DebugFlags::Reconcile) == "reconcile");
    bib_assert(enum_from_name_ifp<DebugFlags>("classify") == DebugFlags::Classify);
    bib_assert(not enum_from_name_ifp<DebugFlags>("everything"));
    bib_assert((DebugFlags::Classify | DebugFlags::Recompute) & DebugFlags::Recompute);
    bib_assert(not (DebugFlags::Classify & DebugFlags::Reconcile));
}};

}
