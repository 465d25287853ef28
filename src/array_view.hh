#ifndef array_view_hh_INCLUDED
#define array_view_hh_INCLUDED

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <type_traits>

namespace Bibsync
{

// An ArrayView provides a typed, non owning view of a memory
// range with an interface similar to std::vector.
template<typename T>
class ArrayView
{
public:
    constexpr ArrayView()
        : m_pointer(nullptr), m_size(0) {}

    constexpr ArrayView(T* pointer, size_t size)
        : m_pointer(pointer), m_size(size) {}

    constexpr ArrayView(T* begin, T* end)
        : m_pointer(begin), m_size(end - begin) {}

    template<size_t N>
    constexpr ArrayView(T(&array)[N]) : m_pointer(array), m_size(N) {}

    template<typename Container>
        requires (not std::is_same_v<std::remove_cvref_t<Container>, ArrayView> and
                  std::is_convertible_v<decltype(std::declval<Container&>().data()), T*>)
    constexpr ArrayView(Container&& c)
        : m_pointer(c.data()), m_size(c.size()) {}

    constexpr ArrayView(const std::initializer_list<std::remove_const_t<T>>& v)
        requires std::is_const_v<T>
        : m_pointer(v.begin()), m_size(v.size()) {}

    constexpr size_t size() const { return m_size; }

    constexpr T& operator[](size_t n) const { return *(m_pointer + n); }

    constexpr T* begin() const { return m_pointer; }
    constexpr T* end()   const { return m_pointer+m_size; }

    constexpr T& back()  const { return *(m_pointer + m_size - 1); }

    constexpr bool empty() const { return m_size == 0; }

    constexpr ArrayView subrange(size_t first, size_t count = (size_t)-1) const
    {
        auto min = [](size_t a, size_t b) { return a < b ? a : b; };
        return ArrayView(m_pointer + min(first, m_size),
                         min(count, m_size - min(first, m_size)));
    }

private:
    T* m_pointer;
    size_t m_size;
};

template<typename T>
using ConstArrayView = ArrayView<const T>;

template<typename T>
bool operator==(ArrayView<T> lhs, ArrayView<T> rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    for (size_t i = 0; i < lhs.size(); ++i)
    {
        if (not (lhs[i] == rhs[i]))
            return false;
    }
    return true;
}

}

#endif // array_view_hh_INCLUDED
