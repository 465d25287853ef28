#ifndef ref_ptr_hh_INCLUDED
#define ref_ptr_hh_INCLUDED

#include <utility>

namespace Bibsync
{

// Intrusive pointer, the Policy decides what acquiring and
// releasing a reference means for the pointee
template<typename T, typename Policy>
struct RefPtr
{
    RefPtr() = default;
    explicit RefPtr(T* ptr) : m_ptr(ptr) { acquire(); }
    ~RefPtr() noexcept { release(); }
    RefPtr(const RefPtr& other) : m_ptr(other.m_ptr) { acquire(); }
    RefPtr(RefPtr&& other) noexcept
        : m_ptr(other.m_ptr) { other.m_ptr = nullptr; }

    RefPtr& operator=(const RefPtr& other)
    {
        reset(other.m_ptr);
        return *this;
    }

    RefPtr& operator=(RefPtr&& other) noexcept
    {
        release();
        m_ptr = other.m_ptr;
        other.m_ptr = nullptr;
        return *this;
    }

    RefPtr& operator=(T* ptr)
    {
        reset(ptr);
        return *this;
    }

    T* operator->() const { return m_ptr; }
    T& operator*() const { return *m_ptr; }

    T* get() const { return m_ptr; }

    explicit operator bool() const { return m_ptr; }

    friend bool operator==(const RefPtr& lhs, const RefPtr& rhs) = default;
    friend bool operator==(const RefPtr& lhs, const T* rhs) { return lhs.m_ptr == rhs; }

private:
    T* m_ptr = nullptr;

    void acquire()
    {
        if (m_ptr)
            Policy::inc_ref(m_ptr);
    }

    void release() noexcept
    {
        if (m_ptr)
            Policy::dec_ref(m_ptr);
    }
};

}

#endif // ref_ptr_hh_INCLUDED
