#include "reference_manager.hh"

#include "change_classifier.hh"
#include "entity_store.hh"
#include "exception.hh"
#include "format.hh"
#include "label_generator.hh"
#include "ranges.hh"
#include "reconciler.hh"
#include "session.hh"
#include "string_utils.hh"
#include "unit_tests.hh"
#include "utils.hh"

#include <algorithm>

namespace Bibsync
{

template<typename T>
static T* mandatory(T* ptr, StringView name)
{
    if (not ptr)
        throw runtime_error(format("'{}' is mandatory", name));
    return ptr;
}

ReferenceManager::ReferenceManager(Session& session)
    : m_session{session},
      m_document{mandatory(session.document(), "document")},
      m_entity_store{mandatory(session.entity_store(), "entity store")},
      m_recompute_task{session.event_manager(), [this](DeferredTask&) { recompute(); }}
{
    configure();
    recompute();

    m_document->register_watcher(*this);
    m_session.options().register_watcher(*this);
}

ReferenceManager::~ReferenceManager()
{
    bib_assert(m_watchers.empty());
    m_session.options().unregister_watcher(*this);
    m_document->unregister_watcher(*this);
}

void ReferenceManager::configure()
{
    const auto& options = m_session.options();
    auto scope = CitationScope::from_options(options);
    auto label_generator = m_session.label_generators().create(
        options["label_generator"].get<String>(),
        {options["label_template"].get<String>(),
         options["label_separator"].get<String>(),
         options["label_compress_ranges"].get<bool>()});

    m_scope = std::move(scope);
    m_label_generator = std::move(label_generator);
}

bool ReferenceManager::debug(DebugFlags flags) const
{
    return m_session.options()["debug"].get<DebugFlags>() & flags;
}

void ReferenceManager::on_document_changed(const Document& document,
                                           ConstArrayView<Document::Change> changes)
{
    const int relevant = first_relevant_change(document, changes, m_scope);
    if (debug(DebugFlags::Classify))
        write_to_debug_buffer(format("classify: {} changes, {}", changes.size(),
                                     relevant >= 0 ? format("change {} is relevant", relevant)
                                                   : String{"none relevant"}));
    if (relevant >= 0)
        schedule_recompute();
}

void ReferenceManager::on_option_changed(const Option& option)
{
    if (option.name() == "debug")
        return;
    try
    {
        configure();
    }
    catch (runtime_error& error)
    {
        write_to_debug_buffer(format("error applying option '{}': {}, previous configuration kept",
                                     option.name(), error.what()));
        return;
    }
    schedule_recompute();
}

void ReferenceManager::schedule_recompute()
{
    if (m_state == State::PendingRecompute)
        return;
    m_state = State::PendingRecompute;
    m_recompute_task.schedule();
}

void ReferenceManager::recompute()
{
    m_state = State::Idle;
    ++m_recompute_count;

    auto markers = collect_citation_markers(*m_document, m_scope);
    if (markers.empty())
    {
        if (debug(DebugFlags::Recompute))
            write_to_debug_buffer("recompute: no citation, labels left untouched");
        return;
    }

    m_labels = compute_citation_labels(markers, *m_label_generator);

    NodeIdList updated;
    m_marker_states.clear();
    for (auto& marker : markers)
    {
        m_marker_states[marker.id] = MarkerState{m_labels.marker_labels.at(marker.id)};
        updated.push_back(marker.id);
    }

    for (auto* entry : m_document->find_all(m_scope.entry_selector()))
        updated.push_back(entry->id);

    if (auto* container = bibliography_container())
        updated.push_back(container->id);

    if (debug(DebugFlags::Recompute))
        write_to_debug_buffer(format("recompute: {} citations, {} cited entries, order: {}",
                                     markers.size(), m_labels.cited.size(),
                                     join(m_labels.cited, " ")));

    auto watchers = m_watchers;
    for (auto* watcher : watchers)
    {
        if (contains(m_watchers, watcher))
            watcher->on_references_updated(*this, updated);
    }
}

const Node* ReferenceManager::bibliography_container() const
{
    return m_document->find(m_scope.container_selector());
}

RidList ReferenceManager::reference_ids() const
{
    return m_document->find_all(m_scope.entry_selector())
         | transform([this](const Node* entry) { return entry->attribute(m_scope.key_attribute); })
         | gather<RidList>();
}

void ReferenceManager::update_references(ConstArrayView<String> new_rids)
{
    auto* container = bibliography_container();
    if (not container)
        throw runtime_error(format("no bibliography container '{}' in document",
                                   m_scope.container_type));

    auto old_rids = reference_ids();
    auto plan = reconcile(*m_document, container->id, m_scope.entry_type,
                          m_scope.key_attribute, old_rids, new_rids);

    if (debug(DebugFlags::Reconcile))
    {
        auto count = [&](ReconcileEdit::Type type) {
            return (int)std::count_if(plan.begin(), plan.end(),
                                      [type](const ReconcileEdit& edit) { return edit.type == type; });
        };
        write_to_debug_buffer(format("reconcile: {} inserted, {} removed, {} moved",
                                     count(ReconcileEdit::Type::Insert),
                                     count(ReconcileEdit::Type::Remove),
                                     count(ReconcileEdit::Type::Move)));
    }

    if (not plan.empty())
        schedule_recompute();
}

const EntityRecord* ReferenceManager::resolve(StringView rid) const
{
    auto it = m_entity_cache.find(rid.str());
    if (it != m_entity_cache.end())
        return it->second;

    auto* record = m_entity_store->get(rid);
    m_entity_cache.emplace(rid.str(), record);
    return record;
}

int ReferenceManager::refresh_entities()
{
    int found = 0;
    for (auto& [rid, record] : m_entity_cache)
    {
        if (record or not (record = m_entity_store->get(rid)))
            continue;
        ++found;
    }
    return found;
}

Bibliography ReferenceManager::bibliography() const
{
    Bibliography res;
    for (auto* entry : m_document->find_all(m_scope.entry_selector()))
    {
        auto rid = entry->attribute(m_scope.key_attribute);
        const int position = m_labels.position(rid);
        res.push_back({entry->id, rid.str(), resolve(rid),
                       position > 0 ? m_labels.entry_labels.at(rid.str()) : String{},
                       position});
    }

    std::stable_sort(res.begin(), res.end(),
                     [](const BibliographyItem& lhs, const BibliographyItem& rhs) {
        if ((lhs.position > 0) != (rhs.position > 0))
            return lhs.position > 0;
        if (lhs.position != rhs.position)
            return lhs.position < rhs.position;
        return lhs.rid < rhs.rid;
    });
    return res;
}

StringView ReferenceManager::marker_label(StringView marker_id) const
{
    auto it = m_marker_states.find(marker_id.str());
    return it != m_marker_states.end() ? StringView{it->second.label} : StringView{};
}

StringView ReferenceManager::entry_label(StringView rid) const
{
    auto it = m_labels.entry_labels.find(rid.str());
    return it != m_labels.entry_labels.end() ? StringView{it->second} : StringView{};
}

int ReferenceManager::entry_position(StringView rid) const
{
    return m_labels.position(rid);
}

void ReferenceManager::register_watcher(ReferenceWatcher& watcher) const
{
    bib_assert(not contains(m_watchers, &watcher));
    m_watchers.push_back(&watcher);
}

void ReferenceManager::unregister_watcher(ReferenceWatcher& watcher) const
{
    auto it = find(m_watchers, &watcher);
    bib_assert(it != m_watchers.end());
    m_watchers.erase(it);
}

namespace
{

// An article with two paragraphs and a bibliography of three entries
struct Article
{
    Article()
    {
        document.create_node("root", -1, "body", {}, "body");
        document.create_node("body", -1, "p", {}, "p1");
        document.create_node("body", -1, "p", {}, "p2");
        document.create_node("root", -1, "back", {}, "back");
        document.create_node("back", -1, "ref-list", {}, "refs");
        for (StringView rid : {"A", "B", "C"})
            document.create_node("refs", -1, "ref", {{"rid", rid.str()}}, format("ref-{}", rid));
        document.commit();

        entities.add({"A", "journal-article", "First"});
        entities.add({"C", "book", "Third"});
    }

    void cite(StringView id, StringView paragraph, StringView rids, int index = -1)
    {
        document.create_node(paragraph, index, "xref", {{"ref-type", "bibr"}, {"rid", rids.str()}}, id);
    }

    Document document;
    MemoryEntityStore entities;
};

struct RecordingWatcher : ReferenceWatcher
{
    void on_references_updated(const ReferenceManager&, ConstArrayView<NodeId> updated) override
    {
        notifications.emplace_back(updated.begin(), updated.end());
    }

    Vector<NodeIdList> notifications;
};

}

UnitTest test_reference_manager_construction{[]{
    Article article;
    {
        Session session{nullptr, &article.entities};
        bib_expect_throw(runtime_error, ReferenceManager{session});
    }
    {
        Session session{&article.document, nullptr};
        bib_expect_throw(runtime_error, ReferenceManager{session});
    }
    {
        Session session{&article.document, &article.entities};
        session.options()["label_generator"].set<String>("roman");
        bib_expect_throw(runtime_error, ReferenceManager{session});
    }

    // labels are computed when constructed
    article.cite("x1", "p1", "B A");
    article.cite("x2", "p2", "A C");
    article.document.commit();

    Session session{&article.document, &article.entities};
    ReferenceManager manager{session};
    bib_assert(manager.state() == ReferenceManager::State::Idle);
    bib_assert(manager.recompute_count() == 1);
    bib_assert(manager.entry_position("B") == 1 and manager.entry_position("A") == 2 and manager.entry_position("C") == 3);
    bib_assert(manager.marker_label("x1") == "1,2");
    bib_assert(manager.marker_label("x2") == "2,3");
    bib_assert(manager.entry_label("C") == "3");
    bib_assert((manager.reference_ids() == RidList{"A", "B", "C"}));
    bib_assert(not session.event_manager().has_pending_events());
}};

UnitTest test_reference_manager_coalescing{[]{
    Article article;
    article.cite("x1", "p1", "A");
    article.document.commit();

    Session session{&article.document, &article.entities};
    ReferenceManager manager{session};
    RecordingWatcher watcher;
    manager.register_watcher(watcher);
    auto unregister = on_scope_end([&] { manager.unregister_watcher(watcher); });

    // two relevant commits before the next turn give a single recompute
    article.cite("x2", "p2", "C B");
    article.document.commit();
    bib_assert(manager.state() == ReferenceManager::State::PendingRecompute);
    article.document.set_attribute("x1", "rid", "B");
    article.document.commit();
    bib_assert(manager.marker_label("x1") == "1");
    bib_assert(manager.recompute_count() == 1);

    bib_assert(session.event_manager().handle_next_events());
    bib_assert(manager.recompute_count() == 2);
    bib_assert(manager.state() == ReferenceManager::State::Idle);
    bib_assert(manager.marker_label("x1") == "1");
    bib_assert(manager.marker_label("x2") == "2,1");
    bib_assert(manager.entry_position("C") == 2 and manager.entry_position("A") == 0);
    bib_assert(manager.entry_label("A") == "");

    bib_assert(watcher.notifications.size() == 1);
    bib_assert((watcher.notifications[0] == NodeIdList{"x1", "x2", "ref-A", "ref-B", "ref-C", "refs"}));

    // irrelevant changes schedule nothing
    article.document.create_node("p1", -1, "xref", {{"ref-type", "fig"}, {"rid", "F1"}}, "f1");
    article.document.set_attribute("p2", "id", "second");
    article.document.commit();
    bib_assert(manager.state() == ReferenceManager::State::Idle);
    bib_assert(not session.event_manager().handle_next_events());
    bib_assert(manager.recompute_count() == 2);

    // moving a citation after an unrelated node recomputes the same labels
    article.document.move_node("x1", 1);
    article.document.commit();
    bib_assert(session.event_manager().run_until_idle() == 1);
    bib_assert(manager.recompute_count() == 3);
    bib_assert(manager.marker_label("x2") == "2,1");
    bib_assert(watcher.notifications.size() == 2 and watcher.notifications[1] == watcher.notifications[0]);
}};

UnitTest test_reference_manager_paragraph_move{[]{
    Article article;
    article.cite("x1", "p1", "A");
    article.cite("x2", "p2", "B");
    article.document.commit();

    Session session{&article.document, &article.entities};
    ReferenceManager manager{session};
    bib_assert(manager.marker_label("x1") == "1" and manager.marker_label("x2") == "2");

    // citations follow the paragraph holding them
    article.document.move_node("p2", 0);
    article.document.commit();
    bib_assert(manager.state() == ReferenceManager::State::PendingRecompute);
    bib_assert(session.event_manager().run_until_idle() == 1);
    bib_assert(manager.marker_label("x2") == "1" and manager.marker_label("x1") == "2");
    bib_assert(manager.entry_position("B") == 1 and manager.entry_position("A") == 2);
    bib_assert(manager.citation_order().size() == 2 and manager.citation_order()[0] == "B");
}};

UnitTest test_reference_manager_empty_scope{[]{
    Article article;
    Session session{&article.document, &article.entities};
    ReferenceManager manager{session};
    RecordingWatcher watcher;
    manager.register_watcher(watcher);
    auto unregister = on_scope_end([&] { manager.unregister_watcher(watcher); });

    bib_assert(manager.recompute_count() == 1);
    bib_assert(manager.citation_order().empty());

    article.cite("x1", "p1", "C");
    article.document.commit();
    session.event_manager().run_until_idle();
    bib_assert(manager.entry_label("C") == "1");
    bib_assert(watcher.notifications.size() == 1);

    // with no citation left nothing is written nor notified
    article.document.delete_node("x1");
    article.document.commit();
    bib_assert(manager.state() == ReferenceManager::State::PendingRecompute);
    session.event_manager().run_until_idle();
    bib_assert(manager.recompute_count() == 3);
    bib_assert(watcher.notifications.size() == 1);
    bib_assert(manager.entry_label("C") == "1");
}};

UnitTest test_reference_manager_bibliography{[]{
    Article article;
    article.cite("x1", "p1", "C");
    article.cite("x2", "p2", "A Z");
    article.document.commit();

    Session session{&article.document, &article.entities};
    ReferenceManager manager{session};

    auto bibliography = manager.bibliography();
    bib_assert(bibliography.size() == 3);
    bib_assert(bibliography[0].rid == "C" and bibliography[0].position == 1 and bibliography[0].label == "1");
    bib_assert(bibliography[1].rid == "A" and bibliography[1].position == 2 and bibliography[1].node == "ref-A");
    bib_assert(bibliography[2].rid == "B" and bibliography[2].position == 0 and bibliography[2].label == "");

    // cited rids without an entry get a position but no entry
    bib_assert(manager.entry_position("Z") == 3);
    bib_assert(manager.available_resources().size() == 3);

    // records are resolved lazily and kept
    bib_assert(bibliography[0].record and bibliography[0].record->title == "Third");
    bib_assert(bibliography[2].record == nullptr);
    article.entities.add({"B", "thesis", "Second"});
    bib_assert(manager.bibliography()[2].record == nullptr);
    bib_assert(manager.refresh_entities() == 1);
    bib_assert(manager.bibliography()[2].record->title == "Second");
    bib_assert(manager.refresh_entities() == 0);

    // uncited entries are ordered by rid
    article.document.delete_node("x1");
    article.document.delete_node("x2");
    article.cite("x3", "p1", "B");
    article.document.commit();
    session.event_manager().run_until_idle();
    bibliography = manager.bibliography();
    bib_assert(bibliography[0].rid == "B" and bibliography[1].rid == "A" and bibliography[2].rid == "C");
}};

UnitTest test_reference_manager_update_references{[]{
    Article article;
    article.cite("x1", "p1", "B D");
    article.document.commit();

    Session session{&article.document, &article.entities};
    ReferenceManager manager{session};
    bib_assert(manager.entry_position("D") == 2);

    RidList rids{"B", "C", "D"};
    manager.update_references(rids);
    bib_assert(manager.reference_ids() == rids);
    bib_assert(article.document.get("ref-B") and article.document.get("ref-C") and not article.document.get("ref-A"));
    bib_assert(manager.state() == ReferenceManager::State::PendingRecompute);

    session.event_manager().run_until_idle();
    auto bibliography = manager.bibliography();
    bib_assert(bibliography.size() == 3);
    bib_assert(bibliography[0].rid == "B" and bibliography[1].rid == "D" and bibliography[1].label == "2");
    bib_assert(bibliography[2].rid == "C" and bibliography[2].label == "");

    // no change, nothing scheduled
    manager.update_references(rids);
    bib_assert(manager.state() == ReferenceManager::State::Idle);

    article.document.delete_node("refs");
    article.document.commit();
    bib_expect_throw(runtime_error, manager.update_references(rids));
}};

UnitTest test_reference_manager_options{[]{
    Article article;
    article.cite("x1", "p1", "A B C");
    article.cite("x2", "p2", "C");
    article.document.commit();

    Session session{&article.document, &article.entities};
    auto& options = session.options();
    options["label_template"].set<String>("[$]");
    options["label_compress_ranges"].set(true);

    ReferenceManager manager{session};
    bib_assert(manager.marker_label("x1") == "[1-3]");
    bib_assert(manager.entry_label("B") == "[2]");

    String log;
    auto previous = set_debug_sink([&](StringView message) { log += message; log += "\n"; });
    auto restore = on_scope_end([&] { set_debug_sink(previous); });

    options["debug"].set_from_string("recompute|classify");
    options["label_generator"].set<String>("alphabetic");
    options["label_separator"].set<String>("; ");
    bib_assert(manager.state() == ReferenceManager::State::PendingRecompute);
    session.event_manager().run_until_idle();
    bib_assert(manager.marker_label("x1") == "[a-c]");
    bib_assert(manager.marker_label("x2") == "[c]");
    bib_assert(log.starts_with("recompute: 2 citations, 3 cited entries, order: A B C"));

    options["citation_kind"].set<String>("fig");
    session.event_manager().run_until_idle();
    bib_assert(manager.scope().kind == "fig");
    bib_assert(manager.marker_label("x1") == "[a-c]");
}};

UnitTest test_reference_manager_invalid_option{[]{
    Article article;
    article.cite("x1", "p1", "A B");
    article.document.commit();

    Session session{&article.document, &article.entities};
    auto& options = session.options();
    ReferenceManager manager{session};
    bib_assert(manager.marker_label("x1") == "1,2");

    String log;
    auto previous = set_debug_sink([&](StringView message) { log += message; log += "\n"; });
    auto restore = on_scope_end([&] { set_debug_sink(previous); });

    // an unknown generator keeps the previous configuration
    options["label_generator"].set<String>("roman");
    bib_assert(manager.state() == ReferenceManager::State::Idle);
    bib_assert(log == "error applying option 'label_generator': no such label generator: 'roman', "
                      "previous configuration kept\n");

    options["label_template"].set<String>("[$]");
    bib_assert(manager.state() == ReferenceManager::State::Idle);
    bib_assert(not session.event_manager().has_pending_events());
    bib_assert(manager.marker_label("x1") == "1,2");

    // a valid generator applies every option again
    options["label_generator"].set<String>("numbered");
    bib_assert(manager.state() == ReferenceManager::State::PendingRecompute);
    session.event_manager().run_until_idle();
    bib_assert(manager.marker_label("x1") == "[1,2]");
    bib_assert(manager.entry_label("B") == "[2]");
}};

}
