#include "change_classifier.hh"

#include "citation_scope.hh"
#include "ranges.hh"
#include "unit_tests.hh"

namespace Bibsync
{

// moving a node reorders every marker below it
static bool contains_marker(const Document& document, const Node& node,
                            const CitationScope& scope)
{
    if (scope.is_marker(node))
        return true;
    return any_of(node.children, [&](const NodeId& child) {
        return contains_marker(document, document.node(child), scope);
    });
}

static bool is_relevant(const Document& document, const Document::Change& change,
                        const CitationScope& scope)
{
    using Type = Document::Change::Type;
    switch (change.type)
    {
        case Type::Create:
        case Type::Delete:
        {
            if (change.node_type != scope.node_type)
                return false;
            auto it = Bibsync::find_if(change.attributes, [&](const Attribute& attr) {
                return attr.name == scope.kind_attribute;
            });
            return it != change.attributes.end() and it->value == scope.kind;
        }
        case Type::Set:
            if (change.attribute == scope.kind_attribute)
                return change.old_value == scope.kind or change.new_value == scope.kind;
            if (change.attribute == scope.rids_attribute)
            {
                auto* node = document.get(change.node);
                return node and node->attribute(scope.kind_attribute) == scope.kind;
            }
            return false;
        case Type::Move:
        {
            auto* node = document.get(change.node);
            return node and contains_marker(document, *node, scope);
        }
    }
    return false;
}

int first_relevant_change(const Document& document,
                          ConstArrayView<Document::Change> changes,
                          const CitationScope& scope)
{
    for (int i = 0; i < (int)changes.size(); ++i)
    {
        if (is_relevant(document, changes[i], scope))
            return i;
    }
    return -1;
}

bool is_citation_relevant(const Document& document,
                          ConstArrayView<Document::Change> changes,
                          const CitationScope& scope)
{
    return first_relevant_change(document, changes, scope) >= 0;
}

UnitTest test_change_classifier{[]{
    const CitationScope scope;
    Document doc;
    auto& body = doc.create_node("root", -1, "body", {}, "body");
    doc.create_node(body.id, -1, "p", {}, "p1");
    doc.commit();

    auto relevant = [&] {
        return is_citation_relevant(doc, doc.pending_changes(), scope);
    };

    // creation of a marker
    doc.create_node("p1", -1, "xref", {{"ref-type", "bibr"}, {"rid", "A"}}, "x1");
    bib_assert(relevant());
    doc.commit();

    // other kinds of cross references, or other node types
    doc.create_node("p1", -1, "xref", {{"ref-type", "fig"}, {"rid", "F1"}}, "x2");
    doc.create_node("p1", -1, "ref", {{"ref-type", "bibr"}}, "r1");
    doc.set_attribute("x2", "rid", "F2");
    doc.set_attribute("p1", "id", "first");
    bib_assert(not relevant());
    bib_assert(first_relevant_change(doc, doc.pending_changes(), scope) == -1);
    doc.commit();

    // kind turned into the citation kind, and back
    doc.set_attribute("x2", "ref-type", "bibr");
    bib_assert(relevant());
    doc.commit();
    doc.set_attribute("x2", "ref-type", "table");
    bib_assert(relevant());
    doc.commit();

    // rids of a current citation
    doc.set_attribute("x1", "rid", "A B");
    bib_assert(relevant());
    doc.commit();

    // rids updated then node deleted in the same batch, deletion is relevant
    doc.set_attribute("x1", "rid", "C");
    doc.delete_node("x1");
    bib_assert(first_relevant_change(doc, doc.pending_changes(), scope) == 1);
    doc.commit();

    // rids of a node deleted afterwards are not, scanning goes on
    doc.create_node("p1", -1, "xref", {{"ref-type", "bibr"}, {"rid", "A"}}, "x3");
    doc.create_node("p1", -1, "xref", {{"ref-type", "bibr"}, {"rid", "B"}}, "x4");
    doc.commit();
    Document::Change stale{Document::Change::Type::Set, "gone", "xref", "p1"};
    stale.attribute = "rid";
    stale.new_value = "Z";
    Document::Change moved{Document::Change::Type::Move, "x4", "xref", "p1"};
    moved.old_index = 3;
    moved.new_index = 2;
    bib_assert(not is_citation_relevant(doc, {stale}, scope));
    bib_assert(first_relevant_change(doc, {stale, moved}, scope) == 1);

    // moving citations changes their order, moving other nodes does not
    doc.move_node("x4", 0);
    bib_assert(relevant());
    doc.commit();
    doc.move_node("x2", 0);
    bib_assert(not relevant());
    doc.commit();

    // nor does moving a paragraph holding only other cross references
    doc.create_node("body", -1, "p", {}, "p2");
    doc.create_node("p2", -1, "xref", {{"ref-type", "fig"}, {"rid", "F3"}}, "x5");
    doc.commit();
    doc.move_node("p2", 0);
    bib_assert(not relevant());
    doc.commit();

    // moving a paragraph moves the citations it holds
    doc.move_node("p1", 0);
    bib_assert(relevant());
    doc.commit();

    // order independent
    doc.set_attribute("p1", "id", "second");
    doc.delete_node("x3");
    bib_assert(relevant());
    doc.commit();
}};

}
