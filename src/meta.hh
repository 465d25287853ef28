#ifndef meta_hh_INCLUDED
#define meta_hh_INCLUDED

namespace Bibsync
{
inline namespace Meta
{

// Tag types used to select overloads on a type without an instance,
// as in memory_domain(Meta::Type<T>{}) or enum_desc(Meta::Type<E>{})
struct AnyType{};
template<typename T> struct Type : AnyType {};

}
}

#endif // meta_hh_INCLUDED
