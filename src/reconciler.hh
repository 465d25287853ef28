#ifndef reconciler_hh_INCLUDED
#define reconciler_hh_INCLUDED

#include "array_view.hh"
#include "document.hh"
#include "vector.hh"

namespace Bibsync
{

struct ReconcileEdit
{
    enum class Type : char { Insert, Remove, Move };

    Type type;
    String key;
    int old_index = -1; // in the old keys, for Remove and Move
    int new_index = -1; // in the new keys, for Insert and Move
};

using ReconcilePlan = Vector<ReconcileEdit, MemoryDomain::Document>;

// Fewest edits turning old_keys into new_keys: keys found in both lists
// are kept in place when they belong to a longest common subsequence,
// moved otherwise.
ReconcilePlan plan_reconcile(ConstArrayView<String> old_keys, ConstArrayView<String> new_keys);

// Updates the children of type child_type of the container so that their
// key_attribute values read new_keys, in a single committed transaction.
// Kept and moved children keep their node id, inserted ones are created
// with only the key attribute set. Throws runtime_error if the current
// children do not match old_keys.
ReconcilePlan reconcile(Document& document, StringView container_id,
                        StringView child_type, StringView key_attribute,
                        ConstArrayView<String> old_keys, ConstArrayView<String> new_keys);

}

#endif // reconciler_hh_INCLUDED
