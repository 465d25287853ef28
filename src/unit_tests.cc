#include "unit_tests.hh"

#include "assert.hh"
#include "diff.hh"
#include "string.hh"

namespace Bibsync
{

UnitTest test_diff{[]()
{
    struct Diff{DiffOp op; int len;};
    auto check_diff = [](StringView a, StringView b, std::initializer_list<Diff> diffs) {
        size_t count = 0;
        for_each_diff(a.begin(), a.length(), b.begin(), b.length(),
                      [&](DiffOp op, int len) {
                          bib_assert(count < diffs.size());
                          auto& d = diffs.begin()[count++];
                          bib_assert(d.op == op and d.len == len);
                      });
        bib_assert(count == diffs.size());
    };
    check_diff("", "", {});
    check_diff("abc", "abc", {{DiffOp::Keep, 3}});
    check_diff("", "ab", {{DiffOp::Add, 2}});
    check_diff("ab", "", {{DiffOp::Remove, 2}});
    check_diff("abcde", "cd", {{DiffOp::Remove, 2}, {DiffOp::Keep, 2}, {DiffOp::Remove, 1}});
    check_diff("abcd", "cdef", {{DiffOp::Remove, 2}, {DiffOp::Keep, 2}, {DiffOp::Add, 2}});
    check_diff("ABC", "BCD", {{DiffOp::Remove, 1}, {DiffOp::Keep, 2}, {DiffOp::Add, 1}});

    auto check_counts = [](StringView a, StringView b, int expected_keep) {
        int keep = 0, add = 0, remove = 0;
        for_each_diff(a.begin(), a.length(), b.begin(), b.length(),
                      [&](DiffOp op, int len) {
                          (op == DiffOp::Keep ? keep : op == DiffOp::Add ? add : remove) += len;
                      });
        bib_assert(keep == expected_keep);
        bib_assert(keep + remove == a.length() and keep + add == b.length());
    };
    check_counts("abcabba", "cbabac", 4);
    check_counts("mais que fais la police", "mais ou va la police", 18);
    check_counts("ABC", "CAB", 2);
}};

#ifdef BIB_DEBUG
UnitTest* UnitTest::list = nullptr;

int UnitTest::run_all_tests()
{
    int count = 0;
    for (const UnitTest* test = UnitTest::list; test; test = test->next, ++count)
        test->func();
    return count;
}
#endif

}
