#include "string.hh"

#include "unit_tests.hh"

namespace Bibsync
{

UnitTest test_string_view{[]{
    StringView rids = "AB06 Mac10";
    bib_assert(rids.length() == 10);
    bib_assert(rids.substr(5) == "Mac10");
    bib_assert(rids.substr(0, 4) == "AB06");
    bib_assert(rids.starts_with("AB"));
    bib_assert(rids.ends_with("10"));
    bib_assert(not rids.ends_with("AB06 Mac10 "));

    String copy{rids};
    copy += " FW15";
    bib_assert(copy == "AB06 Mac10 FW15");
    bib_assert(copy.length() == 15);
    bib_assert("abc"_sv < "abd"_sv);
    bib_assert("ab"_sv < "abc"_sv);
    bib_assert(not ("b"_sv < "abc"_sv));
    bib_assert(String{} == ""_sv);
    bib_assert(hash_value("ref-1"_str) == hash_value("ref-1"_sv));
}};

}
