#ifndef citation_order_hh_INCLUDED
#define citation_order_hh_INCLUDED

#include "array_view.hh"
#include "document.hh"
#include "unordered_map.hh"
#include "vector.hh"

namespace Bibsync
{

struct CitationScope;
class LabelGenerator;

using RidList = Vector<String, MemoryDomain::Citations>;

struct CitationMarker
{
    NodeId id;
    RidList rids; // in listed order, duplicates kept
};

using CitationMarkerList = Vector<CitationMarker, MemoryDomain::Citations>;

// The citation markers of the document in document order, their rid
// attribute split on spaces with empty elements dropped.
CitationMarkerList collect_citation_markers(const Document& document, const CitationScope& scope);

struct CitationLabels
{
    // bibliography position of each cited rid, from 1 in order of first citation
    UnorderedMap<String, int, MemoryDomain::Citations> positions;
    RidList cited; // cited rids ordered by position
    UnorderedMap<NodeId, String, MemoryDomain::Labels> marker_labels;
    UnorderedMap<String, String, MemoryDomain::Labels> entry_labels;

    int position(StringView rid) const;
};

CitationLabels compute_citation_labels(ConstArrayView<CitationMarker> markers,
                                       const LabelGenerator& generator);

}

#endif // citation_order_hh_INCLUDED
