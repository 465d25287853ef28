#include "citation_scope.hh"

#include "document.hh"
#include "format.hh"
#include "option_manager.hh"
#include "ranges.hh"
#include "unit_tests.hh"

namespace Bibsync
{

CitationScope CitationScope::from_options(const OptionManager& options)
{
    auto get = [&](StringView name) { return options[name].get<String>(); };
    return {
        get("citation_node_type"),
        get("citation_kind_attribute"),
        get("citation_kind"),
        get("citation_rids_attribute"),
        get("bibliography_container"),
        get("bibliography_entry_type"),
        get("bibliography_key_attribute"),
    };
}

bool CitationScope::is_marker(const Node& node) const
{
    return node.type == node_type and node.attribute(kind_attribute) == kind;
}

Selector CitationScope::marker_selector() const
{
    const char quote = contains(kind, '\'') ? '"' : '\'';
    return Selector::parse(format("{}[{}={}{}{}]", node_type, kind_attribute,
                                  StringView{quote}, kind, StringView{quote}));
}

Selector CitationScope::container_selector() const
{
    return Selector::parse(container_type);
}

Selector CitationScope::entry_selector() const
{
    return Selector::parse(format("{} > {}", container_type, entry_type));
}

UnitTest test_citation_scope{[]{
    CitationScope scope;
    bib_assert(scope.marker_selector().source() == "xref[ref-type='bibr']");
    bib_assert(scope.entry_selector().source() == "ref-list > ref");

    Document doc;
    doc.create_node("root", -1, "xref", {{"ref-type", "bibr"}}, "x1");
    doc.create_node("root", -1, "xref", {{"ref-type", "fig"}}, "x2");
    doc.create_node("root", -1, "ref", {{"ref-type", "bibr"}}, "x3");
    bib_assert(scope.is_marker(doc.node("x1")));
    bib_assert(not scope.is_marker(doc.node("x2")));
    bib_assert(not scope.is_marker(doc.node("x3")));

    scope.kind = "it's";
    bib_assert(scope.marker_selector().source() == "xref[ref-type=\"it's\"]");
}};

}
