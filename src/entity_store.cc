#include "entity_store.hh"

#include "exception.hh"
#include "unit_tests.hh"

namespace Bibsync
{

const EntityRecord& MemoryEntityStore::add(EntityRecord record)
{
    if (record.id.empty())
        throw runtime_error("entity record id cannot be empty");

    auto& slot = m_records[record.id];
    if (slot)
        *slot = std::move(record);
    else
        slot = std::make_unique<EntityRecord>(std::move(record));
    return *slot;
}

const EntityRecord* MemoryEntityStore::get(StringView id) const
{
    auto it = m_records.find(id.str());
    return it != m_records.end() ? it->second.get() : nullptr;
}

UnitTest test_memory_entity_store{[]{
    MemoryEntityStore store;
    auto& record = store.add({"AB06", "journal-article", "Mechanics of citation"});
    bib_assert(store.get("AB06") == &record);
    bib_assert(store.get("CD07") == nullptr);

    store.add({"AB06", "book", "Mechanics of citation, 2nd edition", {"Doe, J."}, "2006"});
    bib_assert(store.size() == 1);
    bib_assert(store.get("AB06") == &record);
    bib_assert(record.type == "book" and record.authors.size() == 1);

    bib_expect_throw(runtime_error, store.add({}));
}};

}
