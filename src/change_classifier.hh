#ifndef change_classifier_hh_INCLUDED
#define change_classifier_hh_INCLUDED

#include "document.hh"

namespace Bibsync
{

struct CitationScope;

// Returns true if any change of the committed batch can alter the
// order of citations or their labels:
//   - creation or deletion of a citation marker
//   - the kind attribute of a node set to or from the citation kind
//   - the rids of a node currently of the citation kind updated
//   - a citation marker moved inside its parent
// Changes are looked at in order and scanning stops at the first
// relevant one, nodes deleted since the change was recorded are
// not relevant.
bool is_citation_relevant(const Document& document,
                          ConstArrayView<Document::Change> changes,
                          const CitationScope& scope);

// index of the first relevant change, -1 if none
int first_relevant_change(const Document& document,
                          ConstArrayView<Document::Change> changes,
                          const CitationScope& scope);

}

#endif // change_classifier_hh_INCLUDED
