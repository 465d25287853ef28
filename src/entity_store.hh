#ifndef entity_store_hh_INCLUDED
#define entity_store_hh_INCLUDED

#include "safe_ptr.hh"
#include "string.hh"
#include "unordered_map.hh"
#include "vector.hh"

#include <memory>

namespace Bibsync
{

struct EntityRecord
{
    String id;
    String type;
    String title;
    Vector<String, MemoryDomain::Entities> authors;
    String year;
    String container_title;
};

// Source of the bibliographic records cited by the document, a record
// returned by get() must stay alive as long as the store does.
class EntityStore : public SafeCountable
{
public:
    virtual ~EntityStore() = default;

    // nullptr when no record is known for id
    virtual const EntityRecord* get(StringView id) const = 0;
};

class MemoryEntityStore final : public EntityStore
{
public:
    // replaces the content of an existing record with the same id
    const EntityRecord& add(EntityRecord record);

    const EntityRecord* get(StringView id) const override;
    size_t size() const { return m_records.size(); }

private:
    UnorderedMap<String, std::unique_ptr<EntityRecord>, MemoryDomain::Entities> m_records;
};

}

#endif // entity_store_hh_INCLUDED
