#include "ranges.hh"

#include "string.hh"
#include "unit_tests.hh"
#include "vector.hh"

namespace Bibsync
{

UnitTest test_ranges{[] {
    auto check_equal = [](auto&& container, std::initializer_list<StringView> expected) {
        bib_assert(std::equal(container.begin(), container.end(), expected.begin(), expected.end()));
    };
    check_equal("a b c"_sv | split<StringView>(' '), {"a", "b", "c"});
    check_equal(" b c"_sv  | split<StringView>(' '), {"", "b", "c"});
    check_equal(" b "_sv   | split<StringView>(' '), {"", "b", ""});
    check_equal(" "_sv     | split<StringView>(' '), {"", ""});
    check_equal(""_sv      | split<StringView>(' '), {});

    check_equal("AB06  Mac10"_sv | split<StringView>(' ')
                                 | filter([](StringView s) { return not s.empty(); }),
                {"AB06", "Mac10"});

    Vector<int> positions{1, 2, 3};
    auto doubled = positions | transform([](int i) { return i * 2; }) | gather<Vector<int>>();
    bib_assert((doubled == Vector<int>{2, 4, 6}));

    auto rids = "a b"_sv | split<StringView>(' ') | gather<Vector<String>>();
    bib_assert(rids.size() == 2 and rids[1] == "b");

    bib_assert(contains(positions, 2));
    bib_assert(not contains(positions, 4));
    unordered_erase(positions, 1);
    bib_assert(positions.size() == 2 and not contains(positions, 1));
}};

}
