#ifndef utils_hh_INCLUDED
#define utils_hh_INCLUDED

#include <utility>

namespace Bibsync
{

// *** On scope end ***
//
// on_scope_end provides a way to register some code to be
// executed when current scope closes.
//
// usage:
// auto cleaner = on_scope_end([]() { ... });
template<typename T>
class [[nodiscard]] OnScopeEnd
{
public:
    OnScopeEnd(T func) : m_valid{true}, m_func{std::move(func)} {}

    OnScopeEnd(OnScopeEnd&& other)
      : m_valid{other.m_valid}, m_func{std::move(other.m_func)}
    { other.m_valid = false; }

    ~OnScopeEnd() noexcept(noexcept(std::declval<T>()())) { if (m_valid) m_func(); }

private:
    bool m_valid;
    T m_func;
};

template<typename T>
OnScopeEnd<T> on_scope_end(T t)
{
    return OnScopeEnd<T>{std::move(t)};
}

}

#endif // utils_hh_INCLUDED
