#ifndef citation_scope_hh_INCLUDED
#define citation_scope_hh_INCLUDED

#include "selector.hh"
#include "string.hh"

namespace Bibsync
{

class OptionManager;
struct Node;

// Which nodes of the document are bibliographic citations and which
// ones hold the bibliography, with their defaults for JATS documents:
// xref[ref-type='bibr'] citing ref-list > ref through their rid.
struct CitationScope
{
    String node_type = "xref";
    String kind_attribute = "ref-type";
    String kind = "bibr";
    String rids_attribute = "rid";
    String container_type = "ref-list";
    String entry_type = "ref";
    String key_attribute = "rid";

    static CitationScope from_options(const OptionManager& options);

    bool is_marker(const Node& node) const;

    Selector marker_selector() const;
    Selector container_selector() const;
    Selector entry_selector() const;
};

}

#endif // citation_scope_hh_INCLUDED
