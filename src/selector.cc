#include "selector.hh"

#include "document.hh"
#include "exception.hh"
#include "format.hh"
#include "ranges.hh"
#include "string_utils.hh"
#include "unit_tests.hh"

namespace Bibsync
{

static bool is_identifier_char(char c)
{
    return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or
           (c >= '0' and c <= '9') or c == '-' or c == '_' or c == ':' or c == '.';
}

namespace
{

struct SelectorParser
{
    StringView str;
    const char* pos;

    [[noreturn]] void error(StringView message) const
    {
        throw runtime_error(format("invalid selector '{}' at {}: {}",
                                   str, (int)(pos - str.begin()), message));
    }

    bool at_end() const { return pos == str.end(); }

    bool skip_blanks()
    {
        const char* start = pos;
        while (not at_end() and is_blank(*pos))
            ++pos;
        return pos != start;
    }

    StringView identifier()
    {
        const char* start = pos;
        while (not at_end() and is_identifier_char(*pos))
            ++pos;
        return {start, pos};
    }

    String value()
    {
        if (at_end())
            error("expected attribute value");

        const char quote = *pos;
        if (quote != '\'' and quote != '"')
        {
            auto ident = identifier();
            if (ident.empty())
                error("expected attribute value");
            return ident.str();
        }

        const char* start = ++pos;
        while (not at_end() and *pos != quote)
            ++pos;
        if (at_end())
            error("unterminated quoted value");
        return String{start, pos++};
    }

    Selector::AttributeTest attribute_test()
    {
        ++pos; // '['
        skip_blanks();
        auto name = identifier();
        if (name.empty())
            error("expected attribute name");
        skip_blanks();

        Selector::AttributeTest test{name.str(), {}};
        if (not at_end() and *pos == '=')
        {
            ++pos;
            skip_blanks();
            test.value = value();
            skip_blanks();
        }
        if (at_end() or *pos != ']')
            error("expected ']'");
        ++pos;
        return test;
    }

    Selector::Compound compound()
    {
        Selector::Compound res;
        const bool wildcard = not at_end() and *pos == '*';
        if (wildcard)
            ++pos;
        else
            res.type = identifier().str();

        if (res.type.empty() and not wildcard)
            error("expected node type");

        while (not at_end() and *pos == '[')
            res.attributes.push_back(attribute_test());
        return res;
    }
};

}

Selector Selector::parse(StringView selector)
{
    Selector res;
    res.m_source = selector.str();

    SelectorParser parser{selector, selector.begin()};
    parser.skip_blanks();
    if (parser.at_end())
        parser.error("empty selector");

    auto combinator = Combinator::Descendant;
    while (true)
    {
        auto compound = parser.compound();
        compound.combinator = combinator;
        res.m_compounds.push_back(std::move(compound));

        const bool had_blanks = parser.skip_blanks();
        if (parser.at_end())
            break;

        if (*parser.pos == '>')
        {
            ++parser.pos;
            parser.skip_blanks();
            combinator = Combinator::Child;
        }
        else if (had_blanks)
            combinator = Combinator::Descendant;
        else
            parser.error("unexpected character");

        if (parser.at_end())
            parser.error("dangling combinator");
    }
    return res;
}

static bool matches_compound(const Selector::Compound& compound, const Node& node)
{
    if (not compound.type.empty() and compound.type != node.type)
        return false;

    return all_of(compound.attributes, [&](const Selector::AttributeTest& test) {
        auto* value = node.find_attribute(test.name);
        return value and (not test.value or *value == *test.value);
    });
}

bool Selector::matches_from(const Document& document, const Node& node, int index) const
{
    auto& compound = m_compounds[index];
    if (not matches_compound(compound, node))
        return false;
    if (index == 0)
        return true;

    const Node* ancestor = document.get(node.parent);
    if (compound.combinator == Combinator::Child)
        return ancestor and matches_from(document, *ancestor, index - 1);

    for (; ancestor; ancestor = document.get(ancestor->parent))
    {
        if (matches_from(document, *ancestor, index - 1))
            return true;
    }
    return false;
}

bool Selector::matches(const Document& document, const Node& node) const
{
    return not m_compounds.empty() and
           matches_from(document, node, (int)m_compounds.size() - 1);
}

UnitTest test_selector_parsing{[]{
    auto citations = Selector::parse("xref[ref-type='bibr']");
    bib_assert(citations.compounds().size() == 1);
    bib_assert(citations.compounds()[0].type == "xref");
    bib_assert(citations.compounds()[0].attributes.size() == 1);
    bib_assert(citations.compounds()[0].attributes[0].name == "ref-type");
    bib_assert(*citations.compounds()[0].attributes[0].value == "bibr");

    auto entries = Selector::parse("ref-list > ref");
    bib_assert(entries.compounds().size() == 2);
    bib_assert(entries.compounds()[1].type == "ref");
    bib_assert(entries.compounds()[1].combinator == Selector::Combinator::Child);

    auto nested = Selector::parse("  article  xref[rid][ref-type = \"bibr\"] ");
    bib_assert(nested.compounds().size() == 2);
    bib_assert(nested.compounds()[1].combinator == Selector::Combinator::Descendant);
    bib_assert(not nested.compounds()[1].attributes[0].value);
    bib_assert(*nested.compounds()[1].attributes[1].value == "bibr");

    auto any = Selector::parse("*[rid=AB06]");
    bib_assert(any.compounds()[0].type.empty());
    bib_assert(*any.compounds()[0].attributes[0].value == "AB06");

    bib_expect_throw(runtime_error, Selector::parse(""));
    bib_expect_throw(runtime_error, Selector::parse("xref[ref-type='bibr'"));
    bib_expect_throw(runtime_error, Selector::parse("xref[='bibr']"));
    bib_expect_throw(runtime_error, Selector::parse("ref-list >"));
    bib_expect_throw(runtime_error, Selector::parse("ref-list > > ref"));
    bib_expect_throw(runtime_error, Selector::parse("xref[ref-type='bibr]"));
}};

}
