#ifndef flags_hh_INCLUDED
#define flags_hh_INCLUDED

#include "meta.hh"

#include <type_traits>

namespace Bibsync
{

// Enums opt into bitwise operators by declaring
// constexpr bool with_bit_ops(Meta::Type<MyFlags>) { return true; }
template<typename Flags>
constexpr bool with_bit_ops(Meta::Type<Flags>) { return false; }

template<typename Flags>
concept WithBitOps = with_bit_ops(Meta::Type<Flags>{});

template<typename Flags>
using UnderlyingType = std::underlying_type_t<Flags>;

template<WithBitOps Flags>
constexpr Flags operator|(Flags lhs, Flags rhs)
{
    return (Flags)((UnderlyingType<Flags>) lhs | (UnderlyingType<Flags>) rhs);
}

template<WithBitOps Flags>
constexpr Flags& operator|=(Flags& lhs, Flags rhs)
{
    lhs = lhs | rhs;
    return lhs;
}

// Result of a flag test, usable both as a bool and as the masked flags
template<typename Flags>
struct TestableFlags
{
    Flags value;
    constexpr operator bool() const { return (UnderlyingType<Flags>)value; }
    constexpr operator Flags() const { return value; }

    constexpr bool operator==(const TestableFlags<Flags>& other) const = default;
};

template<WithBitOps Flags>
constexpr TestableFlags<Flags> operator&(Flags lhs, Flags rhs)
{
    return { (Flags)((UnderlyingType<Flags>) lhs & (UnderlyingType<Flags>) rhs) };
}

template<WithBitOps Flags>
constexpr Flags& operator&=(Flags& lhs, Flags rhs)
{
    lhs = (Flags)((UnderlyingType<Flags>) lhs & (UnderlyingType<Flags>) rhs);
    return lhs;
}

template<WithBitOps Flags>
constexpr Flags operator~(Flags lhs)
{
    return (Flags)(~(UnderlyingType<Flags>)lhs);
}

}

#endif // flags_hh_INCLUDED
