#ifndef assert_hh_INCLUDED
#define assert_hh_INCLUDED

namespace Bibsync
{

class StringView;

// Logs the failure to the debug buffer then throws assert_failed
void on_assert_failed(const char* message);

}

#define STRINGIFY(X) #X
#define TOSTRING(X) STRINGIFY(X)

#ifdef BIB_DEBUG
    #define bib_assert(...) do { \
        if (not (__VA_ARGS__)) \
            on_assert_failed("assert failed \"" #__VA_ARGS__ \
                             "\" at " __FILE__ ":" TOSTRING(__LINE__)); \
    } while (false)

    #define bib_expect_throw(exception_type, ...) try {\
        __VA_ARGS__; \
        on_assert_failed("expression \"" #__VA_ARGS__ \
                         "\" did not throw \"" #exception_type \
                         "\" at " __FILE__ ":" TOSTRING(__LINE__)); \
    } catch (exception_type&) {}
#else
    #define bib_assert(...) do { (void)sizeof(__VA_ARGS__); } while(false)
    #define bib_expect_throw(_, ...) do { (void)sizeof(__VA_ARGS__); } while(false)
#endif

#endif // assert_hh_INCLUDED
