#include "string_utils.hh"

#include "unit_tests.hh"
#include "vector.hh"

#include <algorithm>

namespace Bibsync
{

String replace(StringView str, StringView substr, StringView replacement)
{
    if (substr.empty())
        return str.str();

    String res;
    for (auto it = str.begin(); it != str.end(); )
    {
        auto match = std::search(it, str.end(), substr.begin(), substr.end());
        res += StringView{it, match};
        if (match == str.end())
            break;

        res += replacement;
        it = match + substr.length();
    }
    return res;
}

UnitTest test_string_utils{[]()
{
    bib_assert(replace("[$]", "$", "1,2") == "[1,2]");
    bib_assert(replace("$-$", "$", "a") == "a-a");
    bib_assert(replace("abc", "", "x") == "abc");

    Vector<String> words{"AB06", "Mac10", "FW15"};
    bib_assert(join(words, ", ") == "AB06, Mac10, FW15");
    bib_assert(join(Vector<String>{}, ",").empty());

    bib_assert(is_blank(' ') and is_blank('\t') and not is_blank('a'));
}};

}
