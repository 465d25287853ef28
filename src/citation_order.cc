#include "citation_order.hh"

#include "citation_scope.hh"
#include "label_generator.hh"
#include "ranges.hh"
#include "unit_tests.hh"

namespace Bibsync
{

CitationMarkerList collect_citation_markers(const Document& document, const CitationScope& scope)
{
    CitationMarkerList markers;
    for (auto* node : document.find_all(scope.marker_selector()))
    {
        markers.push_back({node->id,
                           node->attribute(scope.rids_attribute)
                               | split<StringView>(' ')
                               | filter([](StringView rid) { return not rid.empty(); })
                               | gather<RidList>()});
    }
    return markers;
}

int CitationLabels::position(StringView rid) const
{
    auto it = positions.find(rid.str());
    return it != positions.end() ? it->second : 0;
}

CitationLabels compute_citation_labels(ConstArrayView<CitationMarker> markers,
                                       const LabelGenerator& generator)
{
    CitationLabels res;
    Vector<int, MemoryDomain::Citations> marker_positions;
    for (auto& marker : markers)
    {
        marker_positions.clear();
        for (auto& rid : marker.rids)
        {
            auto [it, inserted] = res.positions.emplace(rid, (int)res.cited.size() + 1);
            if (inserted)
            {
                res.cited.push_back(rid);
                res.entry_labels.emplace(rid, generator.get_label(it->second));
            }
            marker_positions.push_back(it->second);
        }
        res.marker_labels[marker.id] = generator.get_label(marker_positions);
    }
    return res;
}

static CitationMarker marker(StringView id, std::initializer_list<StringView> rids)
{
    return {id.str(), rids | gather<RidList>()};
}

UnitTest test_citation_order{[]{
    NumberedLabelGenerator generator{LabelGeneratorParameters{}};

    // order of first occurrence
    CitationMarker first_order[] = {marker("x1", {"B", "A"}), marker("x2", {"A", "C"})};
    auto labels = compute_citation_labels(first_order, generator);
    bib_assert(labels.position("B") == 1 and labels.position("A") == 2 and labels.position("C") == 3);
    bib_assert((labels.cited == RidList{"B", "A", "C"}));
    bib_assert(labels.marker_labels.at("x1") == "1,2");
    bib_assert(labels.marker_labels.at("x2") == "2,3");
    bib_assert(labels.entry_labels.at("C") == "3");

    // uncited rids have no position nor label
    bib_assert(labels.position("D") == 0 and not labels.entry_labels.contains("D"));
    bib_assert(generator.get_label(labels.position("D")) == "");

    // computing again gives the same result
    auto again = compute_citation_labels(first_order, generator);
    bib_assert(again.positions == labels.positions and again.cited == labels.cited);
    bib_assert(again.marker_labels == labels.marker_labels and again.entry_labels == labels.entry_labels);

    // duplicates are kept, empty markers get an empty label
    CitationMarker duplicates[] = {marker("x1", {"A", "A"}), marker("x2", {}), marker("x3", {"B", "A"})};
    labels = compute_citation_labels(duplicates, generator);
    bib_assert(labels.marker_labels.at("x1") == "1,1");
    bib_assert(labels.marker_labels.at("x2") == "");
    bib_assert(labels.marker_labels.at("x3") == "2,1");
    bib_assert(labels.cited.size() == 2);

    labels = compute_citation_labels({}, generator);
    bib_assert(labels.positions.empty() and labels.marker_labels.empty());
}};

UnitTest test_collect_citation_markers{[]{
    Document doc;
    doc.create_node("root", -1, "p", {}, "p1");
    doc.create_node("p1", -1, "xref", {{"ref-type", "bibr"}, {"rid", "B A"}}, "x1");
    doc.create_node("p1", -1, "xref", {{"ref-type", "fig"}, {"rid", "F1"}}, "f1");
    doc.create_node("root", -1, "p", {}, "p2");
    doc.create_node("p2", -1, "xref", {{"ref-type", "bibr"}, {"rid", " A  C "}}, "x2");
    doc.create_node("p2", 0, "xref", {{"ref-type", "bibr"}}, "x3");

    auto markers = collect_citation_markers(doc, CitationScope{});
    bib_assert(markers.size() == 3);
    bib_assert(markers[0].id == "x1" and (markers[0].rids == RidList{"B", "A"}));
    bib_assert(markers[1].id == "x3" and markers[1].rids.empty());
    bib_assert(markers[2].id == "x2" and (markers[2].rids == RidList{"A", "C"}));
}};

}
