#include "assert.hh"

#include "debug.hh"
#include "exception.hh"
#include "format.hh"

namespace Bibsync
{

struct assert_failed : logic_error
{
    assert_failed(String message)
        : m_message(std::move(message)) {}

    StringView what() const override { return m_message; }
private:
    String m_message;
};

void on_assert_failed(const char* message)
{
    write_to_debug_buffer(format("assert failed: '{}'", message));
    throw assert_failed(message);
}

}
