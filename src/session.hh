#ifndef session_hh_INCLUDED
#define session_hh_INCLUDED

#include "event_manager.hh"
#include "label_generator.hh"
#include "option_manager.hh"
#include "safe_ptr.hh"

namespace Bibsync
{

class Document;
class EntityStore;

// Everything a ReferenceManager works with: the host document and entity
// store, the configuration and the scheduler deferred work runs on.
// The document and entity store are not owned and may be missing.
class Session
{
public:
    Session(Document* document, EntityStore* entity_store);
    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Document* document() const { return m_document.get(); }
    EntityStore* entity_store() const { return m_entity_store.get(); }

    OptionManager& options() { return m_options; }
    const OptionManager& options() const { return m_options; }
    const OptionsRegistry& option_registry() const { return m_option_registry; }

    EventManager& event_manager() { return m_event_manager; }
    LabelGeneratorRegistry& label_generators() { return m_label_generators; }
    const LabelGeneratorRegistry& label_generators() const { return m_label_generators; }

private:
    SafePtr<Document> m_document;
    SafePtr<EntityStore> m_entity_store;

    OptionManager m_options;
    OptionsRegistry m_option_registry{m_options};
    EventManager m_event_manager;
    LabelGeneratorRegistry m_label_generators;
};

void register_options(OptionsRegistry& registry);

}

#endif // session_hh_INCLUDED
