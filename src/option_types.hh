#ifndef option_types_hh_INCLUDED
#define option_types_hh_INCLUDED

#include "enum.hh"
#include "exception.hh"
#include "flags.hh"
#include "format.hh"
#include "ranges.hh"
#include "string.hh"
#include "string_utils.hh"

namespace Bibsync
{

template<typename T>
constexpr decltype(T::option_type_name) option_type_name(Meta::Type<T>)
{
    return T::option_type_name;
}

inline String option_to_string(StringView opt) { return opt.str(); }
inline String option_from_string(Meta::Type<String>, StringView str) { return str.str(); }

inline String option_to_string(bool opt) { return opt ? "true" : "false"; }
inline bool option_from_string(Meta::Type<bool>, StringView str)
{
    if (str == "true" or str == "yes")
        return true;
    if (str == "false" or str == "no")
        return false;
    throw runtime_error("boolean values are either true, yes, false or no");
}
constexpr StringView option_type_name(Meta::Type<bool>) { return "bool"; }

template<DescribedEnum Flags> requires (with_bit_ops(Meta::Type<Flags>{}))
String option_to_string(Flags flags)
{
    String res;
    for (auto& desc : enum_desc(Meta::Type<Flags>{}))
    {
        if (not (flags & desc.value))
            continue;
        if (not res.empty())
            res += '|';
        res += desc.name;
    }
    return res;
}

// flags are written value1|value2, the empty string clears them
template<DescribedEnum Flags> requires (with_bit_ops(Meta::Type<Flags>{}))
Flags option_from_string(Meta::Type<Flags>, StringView str)
{
    Flags res = Flags{};
    for (auto name : str | split<StringView>('|'))
    {
        auto value = enum_from_name_ifp<Flags>(name);
        if (not value)
            throw runtime_error(format("invalid flag value '{}'", name));
        res |= *value;
    }
    return res;
}

template<DescribedEnum Flags> requires (with_bit_ops(Meta::Type<Flags>{}))
String option_type_name(Meta::Type<Flags>)
{
    return format("flags({})", join(enum_desc(Meta::Type<Flags>{}) |
                                    transform([](auto& desc) { return desc.name; }), "|"));
}

}

#endif // option_types_hh_INCLUDED
