#ifndef selector_hh_INCLUDED
#define selector_hh_INCLUDED

#include "string.hh"
#include "vector.hh"

#include <optional>

namespace Bibsync
{

class Document;
struct Node;

// Parsed form of the node selectors used to query a document:
//
//   type                   nodes of the given type, * for any
//   type[attr='value']     with an attribute equal to value
//   type[attr]             with the attribute present
//   a > b                  b whose parent matches a
//   a b                    b with an ancestor matching a
class Selector
{
public:
    struct AttributeTest
    {
        String name;
        std::optional<String> value;
    };

    enum class Combinator : char { Child, Descendant };

    struct Compound
    {
        String type; // empty matches any type
        Vector<AttributeTest, MemoryDomain::Selectors> attributes;
        Combinator combinator = Combinator::Descendant; // relation to the previous compound
    };

    static Selector parse(StringView selector); // throws runtime_error

    bool matches(const Document& document, const Node& node) const;

    const String& source() const { return m_source; }
    const Vector<Compound, MemoryDomain::Selectors>& compounds() const { return m_compounds; }

private:
    bool matches_from(const Document& document, const Node& node, int index) const;

    String m_source;
    Vector<Compound, MemoryDomain::Selectors> m_compounds;
};

}

#endif // selector_hh_INCLUDED
