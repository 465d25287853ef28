#ifndef string_utils_hh_INCLUDED
#define string_utils_hh_INCLUDED

#include "string.hh"

namespace Bibsync
{

String replace(StringView str, StringView substr, StringView replacement);

template<typename Container>
String join(const Container& container, StringView joiner)
{
    String res;
    bool first = true;
    for (const auto& str : container)
    {
        if (not first)
            res += joiner;
        res += str;
        first = false;
    }
    return res;
}

inline bool is_blank(char c) { return c == ' ' or c == '\t' or c == '\n' or c == '\r'; }

}

#endif // string_utils_hh_INCLUDED
