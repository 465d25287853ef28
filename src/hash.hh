#ifndef hash_hh_INCLUDED
#define hash_hh_INCLUDED

#include <type_traits>
#include <utility>

#include <cstddef>

namespace Bibsync
{

size_t hash_data(const char* data, size_t len);

template<typename Type> requires std::is_integral_v<Type>
constexpr size_t hash_value(const Type& val)
{
    return (size_t)val;
}

template<typename Type> requires std::is_enum_v<Type>
constexpr size_t hash_value(const Type& val)
{
    return hash_value((std::underlying_type_t<Type>)val);
}

template<typename Type>
struct Hash
{
    size_t operator()(const Type& val) const
    {
        return hash_value(val);
    }
};

}

#endif // hash_hh_INCLUDED
