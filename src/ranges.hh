#ifndef ranges_hh_INCLUDED
#define ranges_hh_INCLUDED

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

namespace Bibsync
{

template<typename Func> struct ViewFactory { Func func; };

template<typename Func>
ViewFactory<std::remove_cvref_t<Func>> make_view_factory(Func&& func) { return {std::forward<Func>(func)}; }

template<typename Range, typename Func>
decltype(auto) operator| (Range&& range, ViewFactory<Func> factory)
{
    return factory.func(std::forward<Range>(range));
}

// lvalue ranges are held by reference, temporaries are moved into the view
template<typename Range>
struct DecayRangeImpl { using type = std::remove_cvref_t<Range>; };

template<typename Range>
struct DecayRangeImpl<Range&> { using type = Range&; };

template<typename Range>
using DecayRange = typename DecayRangeImpl<Range>::type;

template<typename Range>
using RangeIterator = decltype(std::begin(std::declval<const std::remove_reference_t<Range>&>()));

template<typename Range, typename Transform>
struct TransformView
{
    using RangeIt = RangeIterator<Range>;
    using ResType = decltype(std::declval<const Transform&>()(*std::declval<RangeIt>()));

    struct Iterator
    {
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::remove_cvref_t<ResType>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = ResType;

        Iterator() = default;
        Iterator(const Transform& transform, RangeIt it)
            : m_it{std::move(it)}, m_transform{&transform} {}

        decltype(auto) operator*() const { return (*m_transform)(*m_it); }

        Iterator& operator++() { ++m_it; return *this; }
        Iterator operator++(int) { auto copy = *this; ++m_it; return copy; }

        friend bool operator==(const Iterator& lhs, const Iterator& rhs) { return lhs.m_it == rhs.m_it; }

    private:
        RangeIt m_it{};
        const Transform* m_transform = nullptr;
    };

    Iterator begin() const { return {m_transform, std::begin(m_range)}; }
    Iterator end()   const { return {m_transform, std::end(m_range)}; }

    Range m_range;
    Transform m_transform;
};

template<typename Transform>
auto transform(Transform t)
{
    return make_view_factory([t = std::move(t)]<typename Range>(Range&& range) {
        return TransformView<DecayRange<Range>, Transform>{std::forward<Range>(range), t};
    });
}

template<typename Range, typename Filter>
struct FilterView
{
    using RangeIt = RangeIterator<Range>;

    struct Iterator
    {
        using iterator_category = std::forward_iterator_tag;
        using value_type = typename std::iterator_traits<RangeIt>::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = typename std::iterator_traits<RangeIt>::pointer;
        using reference = typename std::iterator_traits<RangeIt>::reference;

        Iterator() = default;
        Iterator(const Filter& filter, RangeIt it, RangeIt end)
            : m_it{std::move(it)}, m_end{std::move(end)}, m_filter{&filter}
        {
            skip_rejected();
        }

        decltype(auto) operator*() const { return *m_it; }

        Iterator& operator++() { ++m_it; skip_rejected(); return *this; }
        Iterator operator++(int) { auto copy = *this; ++(*this); return copy; }

        friend bool operator==(const Iterator& lhs, const Iterator& rhs) { return lhs.m_it == rhs.m_it; }

    private:
        void skip_rejected()
        {
            while (m_it != m_end and not (*m_filter)(*m_it))
                ++m_it;
        }

        RangeIt m_it{};
        RangeIt m_end{};
        const Filter* m_filter = nullptr;
    };

    Iterator begin() const { return {m_filter, std::begin(m_range), std::end(m_range)}; }
    Iterator end()   const { return {m_filter, std::end(m_range), std::end(m_range)}; }

    Range m_range;
    Filter m_filter;
};

template<typename Filter>
auto filter(Filter f)
{
    return make_view_factory([f = std::move(f)]<typename Range>(Range&& range) {
        return FilterView<DecayRange<Range>, Filter>{std::forward<Range>(range), f};
    });
}

// Splits a contiguous range on each occurence of separator, empty
// elements are kept so that "a,,b" gives "a", "", "b"
template<typename Range, typename Element, typename ValueType>
struct SplitView
{
    using RangeIt = RangeIterator<Range>;

    struct Iterator
    {
        using iterator_category = std::forward_iterator_tag;
        using value_type = ValueType;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = ValueType;

        Iterator() = default;
        Iterator(RangeIt pos, RangeIt end, Element separator)
            : m_pos{pos}, m_split_end{std::find(pos, end, separator)}, m_end{end},
              m_separator{separator}, m_done{pos == end} {}

        ValueType operator*() const { return {m_pos, m_split_end}; }

        Iterator& operator++()
        {
            if (m_split_end == m_end)
            {
                m_pos = m_end;
                m_done = true;
            }
            else
            {
                m_pos = std::next(m_split_end);
                m_split_end = std::find(m_pos, m_end, m_separator);
            }
            return *this;
        }
        Iterator operator++(int) { auto copy = *this; ++(*this); return copy; }

        friend bool operator==(const Iterator& lhs, const Iterator& rhs)
        {
            return lhs.m_pos == rhs.m_pos and lhs.m_done == rhs.m_done;
        }

    private:
        RangeIt m_pos{};
        RangeIt m_split_end{};
        RangeIt m_end{};
        Element m_separator{};
        bool m_done = true;
    };

    Iterator begin() const { return {std::begin(m_range), std::end(m_range), m_separator}; }
    Iterator end()   const { return {std::end(m_range), std::end(m_range), m_separator}; }

    Range m_range;
    Element m_separator;
};

template<typename ValueType, typename Element>
auto split(Element separator)
{
    return make_view_factory([s = std::move(separator)]<typename Range>(Range&& range) {
        return SplitView<DecayRange<Range>, Element, ValueType>{std::forward<Range>(range), s};
    });
}

template<typename Container>
auto gather()
{
    return make_view_factory([](auto&& range) {
        Container res;
        for (auto&& elem : range)
            res.emplace_back(std::forward<decltype(elem)>(elem));
        return res;
    });
}

template<typename Range, typename T>
auto find(Range&& range, const T& value)
{
    return std::find(std::begin(range), std::end(range), value);
}

template<typename Range, typename T>
auto find_if(Range&& range, T op)
{
    return std::find_if(std::begin(range), std::end(range), op);
}

template<typename Range, typename T>
bool contains(Range&& range, const T& value)
{
    using std::end;
    return find(range, value) != end(range);
}

template<typename Range, typename T>
bool all_of(Range&& range, T op)
{
    return std::all_of(std::begin(range), std::end(range), op);
}

template<typename Range, typename T>
bool any_of(Range&& range, T op)
{
    return std::any_of(std::begin(range), std::end(range), op);
}

template<typename Range, typename U>
void unordered_erase(Range&& vec, U&& value)
{
    auto it = find(vec, std::forward<U>(value));
    if (it != vec.end())
    {
        using std::swap;
        swap(vec.back(), *it);
        vec.pop_back();
    }
}

}

#endif // ranges_hh_INCLUDED
