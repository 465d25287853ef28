#ifndef format_hh_INCLUDED
#define format_hh_INCLUDED

#include "array_view.hh"
#include "string.hh"

#include <type_traits>

namespace Bibsync
{

template<size_t N>
struct InplaceString
{
    static_assert(N < 256, "InplaceString cannot handle sizes >= 256");

    constexpr operator StringView() const { return {m_data, (int)m_length}; }
    operator String() const { return {m_data, (int)m_length}; }

    unsigned char m_length{};
    char m_data[N];
};

InplaceString<15> to_string(int val);
InplaceString<15> to_string(unsigned val);
InplaceString<23> to_string(long int val);
InplaceString<23> to_string(unsigned long val);
InplaceString<23> to_string(long long int val);

namespace detail
{

template<typename T> requires std::is_convertible_v<T, StringView>
StringView format_param(const T& val) { return val; }

template<typename T> requires (not std::is_convertible_v<T, StringView>)
decltype(auto) format_param(const T& val) { return to_string(val); }

}

// Replaces each {} in fmt with the next parameter, {N} with the Nth one,
// a backslash escapes an opening brace
String format(StringView fmt, ConstArrayView<StringView> params);

template<typename... Types>
String format(StringView fmt, Types&&... params)
{
    return format(fmt, ConstArrayView<StringView>{detail::format_param(std::forward<Types>(params))...});
}

}

#endif // format_hh_INCLUDED
