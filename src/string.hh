#ifndef string_hh_INCLUDED
#define string_hh_INCLUDED

#include "memory.hh"
#include "hash.hh"

#include <compare>
#include <cstring>
#include <iterator>
#include <string>
#include <type_traits>

namespace Bibsync
{

class StringView;

template<typename Type, typename CharType>
class StringOps
{
public:
    using value_type = CharType;

    friend size_t hash_value(const Type& str)
    {
        return hash_data(str.data(), (size_t)str.length());
    }

    using iterator = CharType*;
    using const_iterator = const CharType*;

    iterator begin() { return type().data(); }
    const_iterator begin() const { return type().data(); }

    iterator end() { return type().data() + type().length(); }
    const_iterator end() const { return type().data() + type().length(); }

    CharType& front() { return *type().data(); }
    const CharType& front() const { return *type().data(); }
    CharType& back() { return type().data()[type().length() - 1]; }
    const CharType& back() const { return type().data()[type().length() - 1]; }

    CharType& operator[](int pos) { return type().data()[pos]; }
    const CharType& operator[](int pos) const { return type().data()[pos]; }

    bool empty() const { return type().length() == 0; }

    bool starts_with(StringView str) const;
    bool ends_with(StringView str) const;

    StringView substr(int from, int length = -1) const;

private:
    Type& type() { return *static_cast<Type*>(this); }
    const Type& type() const { return *static_cast<const Type*>(this); }
};

constexpr int strlen(const char* s)
{
    int i = 0;
    while (*s++ != 0)
        ++i;
    return i;
}

// Owning string, storage is accounted in the String memory domain
class String : public StringOps<String, char>
{
public:
    String() {}
    String(const char* content) : m_data(content, (size_t)strlen(content)) {}
    String(const char* content, int len) : m_data(content, (size_t)len) {}
    String(const char* begin, const char* end) : m_data(begin, end) {}
    explicit String(char c, int count = 1) : m_data((size_t)count, c) {}
    explicit String(StringView str);

    char* data() { return m_data.data(); }
    const char* data() const { return m_data.data(); }

    int length() const { return (int)m_data.size(); }

    void append(const char* data, int count) { m_data.append(data, (size_t)count); }

    void clear() { m_data.clear(); }
    void push_back(char c) { m_data.push_back(c); }
    void reserve(int size) { m_data.reserve((size_t)size); }

    static constexpr const char* option_type_name = "str";

private:
    using Storage = std::basic_string<char, std::char_traits<char>,
                                      Allocator<char, MemoryDomain::String>>;
    Storage m_data;
};

class StringView : public StringOps<StringView, const char>
{
public:
    StringView() = default;
    constexpr StringView(const char* data, int length)
        : m_data{data}, m_length{length} {}
    constexpr StringView(const char* data) : m_data{data}, m_length{data ? strlen(data) : 0} {}
    constexpr StringView(const char* begin, const char* end) : m_data{begin}, m_length{(int)(end - begin)} {}
    StringView(const String& str) : m_data{str.data()}, m_length{str.length()} {}
    StringView(const char& c) : m_data(&c), m_length(1) {}
    StringView(int c) = delete;

    constexpr const char* data() const { return m_data; }
    constexpr int length() const { return m_length; }

    String str() const { return {m_data, m_length}; }

private:
    const char* m_data;
    int m_length;
};

static_assert(std::is_trivial<StringView>::value, "");

inline String::String(StringView str) : String{str.begin(), str.length()} {}

template<typename Type, typename CharType>
inline StringView StringOps<Type, CharType>::substr(int from, int length) const
{
    const auto str_length = type().length();
    const auto max_length = str_length - from;
    bib_assert(from >= 0 and max_length >= 0);
    return StringView{type().data() + from, length >= 0 and length < max_length ? length : max_length};
}

template<typename Type, typename CharType>
inline bool StringOps<Type, CharType>::starts_with(StringView str) const
{
    if (type().length() < str.length())
        return false;
    return substr(0, str.length()) == str;
}

template<typename Type, typename CharType>
inline bool StringOps<Type, CharType>::ends_with(StringView str) const
{
    if (type().length() < str.length())
        return false;
    return substr(type().length() - str.length()) == str;
}

inline String& operator+=(String& lhs, StringView rhs)
{
    lhs.append(rhs.data(), rhs.length());
    return lhs;
}

inline String operator+(StringView lhs, StringView rhs)
{
    String res;
    res.reserve(lhs.length() + rhs.length());
    res.append(lhs.data(), lhs.length());
    res.append(rhs.data(), rhs.length());
    return res;
}

inline bool operator==(const StringView& lhs, const StringView& rhs)
{
    return lhs.length() == rhs.length() and
           (lhs.empty() or std::memcmp(lhs.begin(), rhs.begin(), (size_t)lhs.length()) == 0);
}

inline std::strong_ordering operator<=>(const StringView& lhs, const StringView& rhs)
{
    const int len = lhs.length() < rhs.length() ? lhs.length() : rhs.length();
    if (int cmp = len != 0 ? std::memcmp(lhs.data(), rhs.data(), (size_t)len) : 0; cmp != 0)
        return cmp < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
    return lhs.length() <=> rhs.length();
}

inline String operator""_str(const char* str, size_t)
{
    return String(str);
}

inline StringView operator""_sv(const char* str, size_t)
{
    return StringView{str};
}

}

#endif // string_hh_INCLUDED
