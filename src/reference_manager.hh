#ifndef reference_manager_hh_INCLUDED
#define reference_manager_hh_INCLUDED

#include "citation_order.hh"
#include "citation_scope.hh"
#include "debug.hh"
#include "document.hh"
#include "event_manager.hh"
#include "option_manager.hh"
#include "safe_ptr.hh"

#include <memory>

namespace Bibsync
{

class EntityStore;
class LabelGenerator;
class ReferenceManager;
class Session;
struct EntityRecord;

class ReferenceWatcher
{
public:
    // updated holds every marker and entry node whose derived state was
    // rewritten, followed by the bibliography container
    virtual void on_references_updated(const ReferenceManager& manager,
                                       ConstArrayView<NodeId> updated) = 0;
protected:
    ~ReferenceWatcher() = default;
};

struct BibliographyItem
{
    NodeId node;
    String rid;
    const EntityRecord* record; // nullptr if the entity store does not know rid
    String label;               // empty when not cited
    int position;               // 0 when not cited
};

using Bibliography = Vector<BibliographyItem, MemoryDomain::NodeState>;

// Keeps the labels of citations and bibliography entries in sync with
// the document.
//
// Committed document changes are classified, relevant ones schedule a
// recompute on the session event manager. Any number of relevant
// commits before the next turn are coalesced into a single recompute
// that reads the citations as they are at that point.
class ReferenceManager final : public SafeCountable,
                               private DocumentWatcher,
                               private OptionManagerWatcher
{
public:
    enum class State
    {
        Idle,
        PendingRecompute
    };

    // throws runtime_error when the session has no document or entity store
    explicit ReferenceManager(Session& session);
    ~ReferenceManager();

    ReferenceManager(const ReferenceManager&) = delete;
    ReferenceManager& operator=(const ReferenceManager&) = delete;

    // rids of the current bibliography entries, in document order
    RidList reference_ids() const;

    // makes the bibliography entries match new_rids with the fewest node
    // insertions, removals and moves, then schedules a recompute
    void update_references(ConstArrayView<String> new_rids);

    // entries sorted by position, uncited entries last ordered by rid
    Bibliography bibliography() const;
    Bibliography available_resources() const { return bibliography(); }

    // retries the entity store for entries which had no record,
    // returns the number of records found
    int refresh_entities();

    StringView marker_label(StringView marker_id) const;
    StringView entry_label(StringView rid) const;
    int entry_position(StringView rid) const;
    ConstArrayView<String> citation_order() const { return m_labels.cited; }

    State state() const { return m_state; }
    int recompute_count() const { return m_recompute_count; }
    const CitationScope& scope() const { return m_scope; }

    void register_watcher(ReferenceWatcher& watcher) const;
    void unregister_watcher(ReferenceWatcher& watcher) const;

private:
    void on_document_changed(const Document& document,
                             ConstArrayView<Document::Change> changes) override;
    void on_option_changed(const Option& option) override;

    void configure();
    void schedule_recompute();
    void recompute();

    const Node* bibliography_container() const;
    const EntityRecord* resolve(StringView rid) const;
    bool debug(DebugFlags flags) const;

    struct MarkerState
    {
        String label;
    };

    Session& m_session;
    SafePtr<Document> m_document;
    SafePtr<EntityStore> m_entity_store;

    CitationScope m_scope;
    std::unique_ptr<LabelGenerator> m_label_generator;

    DeferredTask m_recompute_task;
    State m_state = State::Idle;
    int m_recompute_count = 0;

    CitationLabels m_labels;
    UnorderedMap<NodeId, MarkerState, MemoryDomain::NodeState> m_marker_states;

    // successful lookups are kept for the manager lifetime, misses
    // are kept as nullptr until refresh_entities()
    mutable UnorderedMap<String, const EntityRecord*, MemoryDomain::Entities> m_entity_cache;

    mutable Vector<ReferenceWatcher*, MemoryDomain::Watchers> m_watchers;
};

}

#endif // reference_manager_hh_INCLUDED
