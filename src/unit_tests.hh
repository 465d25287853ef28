#ifndef unit_tests_hh_INCLUDED
#define unit_tests_hh_INCLUDED

#include "assert.hh"

namespace Bibsync
{

// Tests are declared at namespace scope next to the code they exercise:
//   UnitTest test_something{[]{ bib_assert(...); }};
// they only register themselves in BIB_DEBUG builds.
struct UnitTest
{
#ifdef BIB_DEBUG
    UnitTest(void (*func)()) : func(func), next(list) { list = this; }
    void (*func)();
    const UnitTest* next;

    static int run_all_tests();
    static UnitTest* list;
#else
    UnitTest(void (*)()) {}
#endif
};

}

#endif // unit_tests_hh_INCLUDED
