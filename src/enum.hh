#ifndef enum_hh_INCLUDED
#define enum_hh_INCLUDED

#include "meta.hh"
#include "string.hh"

#include <cstddef>
#include <optional>
#include <utility>

namespace Bibsync
{

template<typename T, size_t N>
struct Array
{
    constexpr size_t size() const { return N; }
    constexpr const T& operator[](size_t i) const { return m_data[i]; }
    constexpr const T* begin() const { return m_data; }
    constexpr const T* end() const { return m_data+N; }

    T m_data[N];
};

template<typename T, size_t N, size_t... Indices>
constexpr Array<T, N> make_array(const T (&data)[N], std::index_sequence<Indices...>)
{
    return {{data[Indices]...}};
}

template<typename T, size_t N>
constexpr Array<T, N> make_array(const T (&data)[N])
{
    return make_array(data, std::make_index_sequence<N>());
}

template<typename T> struct EnumDesc { T value; StringView name; };

template<typename T>
concept DescribedEnum = requires { enum_desc(Meta::Type<T>{}); };

template<DescribedEnum Enum>
StringView enum_name(Enum value)
{
    for (auto& desc : enum_desc(Meta::Type<Enum>{}))
    {
        if (desc.value == value)
            return desc.name;
    }
    return {};
}

template<DescribedEnum Enum>
std::optional<Enum> enum_from_name_ifp(StringView name)
{
    for (auto& desc : enum_desc(Meta::Type<Enum>{}))
    {
        if (desc.name == name)
            return desc.value;
    }
    return {};
}

}

#endif // enum_hh_INCLUDED
