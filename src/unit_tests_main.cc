#include "debug.hh"
#include "exception.hh"
#include "format.hh"
#include "unit_tests.hh"

#include <exception>
#include <typeinfo>

int main()
{
    using namespace Bibsync;

#ifdef BIB_DEBUG
    try
    {
        const int count = UnitTest::run_all_tests();
        write_to_debug_buffer(format("{} unit tests passed", count));
    }
    catch (Bibsync::exception& error)
    {
        write_to_debug_buffer(format("unit test failed: {}", error.what()));
        return 1;
    }
    catch (std::exception& error)
    {
        write_to_debug_buffer(format("uncaught exception ({}):\n{}", typeid(error).name(), error.what()));
        return 1;
    }
#else
    write_to_debug_buffer("unit tests are only available when built with BIB_DEBUG");
#endif
    return 0;
}
