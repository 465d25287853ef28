#include "session.hh"

#include "debug.hh"
#include "document.hh"
#include "entity_store.hh"
#include "unit_tests.hh"

namespace Bibsync
{

Session::Session(Document* document, EntityStore* entity_store)
    : m_document{document}, m_entity_store{entity_store}
{
    register_options(m_option_registry);
}

Session::~Session() = default;

void register_options(OptionsRegistry& reg)
{
    reg.declare_option<String>("citation_node_type", "type of the citation nodes", "xref");
    reg.declare_option<String>("citation_kind_attribute",
                               "attribute telling the kind of a citation node", "ref-type");
    reg.declare_option<String>("citation_kind",
                               "kind of the citations referring to the bibliography", "bibr");
    reg.declare_option<String>("citation_rids_attribute",
                               "space separated list of the cited bibliography entries", "rid");
    reg.declare_option<String>("bibliography_container", "type of the bibliography node", "ref-list");
    reg.declare_option<String>("bibliography_entry_type", "type of the bibliography entries", "ref");
    reg.declare_option<String>("bibliography_key_attribute",
                               "attribute identifying a bibliography entry", "rid");
    reg.declare_option<String>("label_generator", "name of the label generator", "numbered");
    reg.declare_option<String>("label_template", "label text, $ is replaced by the positions", "$");
    reg.declare_option<String>("label_separator", "separator between positions of a label", ",");
    reg.declare_option<bool>("label_compress_ranges",
                             "render runs of three or more positions as first-last", false);
    reg.declare_option<DebugFlags>("debug", "", DebugFlags::None);
}

UnitTest test_session{[]{
    Document document;
    MemoryEntityStore entities;
    Session session{&document, &entities};
    bib_assert(session.document() == &document and session.entity_store() == &entities);

    auto& options = session.options();
    bib_assert(options["citation_kind"].get<String>() == "bibr");
    bib_assert(options["bibliography_container"].get<String>() == "ref-list");
    bib_assert(not options["label_compress_ranges"].get<bool>());
    bib_assert(options["debug"].get<DebugFlags>() == DebugFlags::None);
    bib_assert(session.option_registry().option_exists("label_template"));
    bib_assert(session.label_generators().has_generator("numbered"));

    Session empty{nullptr, nullptr};
    bib_assert(not empty.document() and not empty.entity_store());
}};

}
