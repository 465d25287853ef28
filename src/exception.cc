#include "exception.hh"

#include <typeinfo>

namespace Bibsync
{

StringView exception::what() const
{
    return typeid(*this).name();
}

}
