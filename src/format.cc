#include "format.hh"

#include "exception.hh"
#include "unit_tests.hh"

#include <algorithm>
#include <charconv>

namespace Bibsync
{

template<size_t N>
InplaceString<N> to_string_impl(auto val)
{
    InplaceString<N> res;
    auto [end, errc] = std::to_chars(res.m_data, res.m_data + N - 1, val);
    if (errc != std::errc{})
        throw runtime_error("to_string error");
    res.m_length = end - res.m_data;
    *end = '\0';
    return res;
}

InplaceString<15> to_string(int val)
{
    return to_string_impl<15>(val);
}

InplaceString<15> to_string(unsigned val)
{
    return to_string_impl<15>(val);
}

InplaceString<23> to_string(long int val)
{
    return to_string_impl<23>(val);
}

InplaceString<23> to_string(unsigned long val)
{
    return to_string_impl<23>(val);
}

InplaceString<23> to_string(long long int val)
{
    return to_string_impl<23>(val);
}

static int parse_index(StringView str)
{
    int res = 0;
    for (auto c : str)
    {
        if (c < '0' or c > '9')
            throw runtime_error("format string parameter index is not a number");
        res = res * 10 + (c - '0');
    }
    return res;
}

String format(StringView fmt, ConstArrayView<StringView> params)
{
    String res;
    res.reserve(fmt.length());

    int implicit_param = 0;
    for (auto it = fmt.begin(), end = fmt.end(); it != end; )
    {
        auto opening = std::find(it, end, '{');
        if (opening == end)
        {
            res += StringView{it, end};
            break;
        }
        if (opening != it and *(opening-1) == '\\')
        {
            res += StringView{it, opening-1};
            res += '{';
            it = opening + 1;
            continue;
        }

        res += StringView{it, opening};
        auto closing = std::find(opening, end, '}');
        if (closing == end)
            throw runtime_error("format string error, unclosed '{'");

        const int index = (closing == opening + 1) ?
            implicit_param : parse_index({opening+1, closing});
        if (index < 0 or (size_t)index >= params.size())
            throw runtime_error("format string parameter index too big");

        res += params[index];
        implicit_param = index + 1;
        it = closing + 1;
    }
    return res;
}

UnitTest test_format{[]{
    bib_assert(format("recomputed {} labels", 3) == "recomputed 3 labels");
    bib_assert(format("{}/{}", "xref"_sv, "bibr"_str) == "xref/bibr");
    bib_assert(format("{1} {0}", "a", "b") == "b a");
    bib_assert(format("\\{} {}", 42) == "{} 42");
    bib_assert(format("{}", -7) == "-7");
    bib_assert(format("no params") == "no params");
    bib_expect_throw(runtime_error, format("{} {}", 1));
    bib_expect_throw(runtime_error, format("{", 1));
}};

}
