#ifndef document_hh_INCLUDED
#define document_hh_INCLUDED

#include "array_view.hh"
#include "safe_ptr.hh"
#include "string.hh"
#include "unordered_map.hh"
#include "vector.hh"

#include <memory>

namespace Bibsync
{

class Selector;

using NodeId = String;
using NodeIdList = Vector<NodeId, MemoryDomain::Document>;

struct Attribute
{
    String name;
    String value;

    friend bool operator==(const Attribute&, const Attribute&) = default;
};

using AttributeList = Vector<Attribute, MemoryDomain::Document>;

struct Node : UseMemoryDomain<MemoryDomain::Document>
{
    Node(NodeId id, String type, AttributeList attributes, NodeId parent)
        : id{std::move(id)}, type{std::move(type)},
          attributes{std::move(attributes)}, parent{std::move(parent)} {}

    const String* find_attribute(StringView name) const;
    // empty when the attribute is not set
    StringView attribute(StringView name) const;

    NodeId id;
    String type;
    AttributeList attributes;
    NodeId parent;
    NodeIdList children;
};

class DocumentWatcher;

// Tree of typed nodes addressed by id.
//
// Mutations are accumulated as pending changes and published as a
// single batch by commit(), which then notifies the registered
// watchers. Every commit increments the document timestamp.
class Document : public SafeCountable
{
public:
    struct Change
    {
        enum class Type : char { Create, Delete, Set, Move };

        Type type;
        NodeId node;
        String node_type;
        NodeId parent;
        AttributeList attributes; // node attributes for Create and Delete
        String attribute;         // changed attribute for Set
        String old_value;
        String new_value;
        int old_index = -1;
        int new_index = -1;
    };
    using ChangeList = Vector<Change, MemoryDomain::Document>;

    explicit Document(String root_type = "document");
    ~Document();

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    const Node& root() const { return *m_root; }

    const Node* get(StringView id) const;
    const Node& node(StringView id) const; // throws if not found
    const NodeIdList& children(StringView id) const { return node(id).children; }
    int index_of(const Node& node) const;

    // first match in document order
    const Node* find(const Selector& selector) const;
    const Node* find(StringView selector) const;
    Vector<const Node*, MemoryDomain::Document> find_all(const Selector& selector) const;
    Vector<const Node*, MemoryDomain::Document> find_all(StringView selector) const;

    // index -1 appends, an empty id gets a generated one
    const Node& create_node(StringView parent, int index, StringView type,
                            AttributeList attributes = {}, StringView id = {});
    void delete_node(StringView id);
    void set_attribute(StringView id, StringView name, StringView value);
    // index is the final position among the parent children
    void move_node(StringView id, int index);

    size_t commit();
    size_t timestamp() const { return m_commit_offsets.size(); }
    bool has_pending_changes() const { return not m_pending.empty(); }
    ConstArrayView<Change> pending_changes() const { return m_pending; }
    ConstArrayView<Change> changes_since(size_t timestamp) const;

    void register_watcher(DocumentWatcher& watcher) const;
    void unregister_watcher(DocumentWatcher& watcher) const;

private:
    Node& mutable_node(StringView id);
    NodeId generate_id(StringView type);
    void delete_subtree(Node& node);

    template<typename Func>
    bool visit(const Node& node, Func&& func) const;

    UnorderedMap<NodeId, std::unique_ptr<Node>, MemoryDomain::Document> m_nodes;
    Node* m_root;
    ChangeList m_pending;
    ChangeList m_history;
    Vector<size_t, MemoryDomain::Document> m_commit_offsets;
    int m_next_id = 0;

    mutable Vector<DocumentWatcher*, MemoryDomain::Watchers> m_watchers;
};

class DocumentWatcher
{
public:
    virtual void on_document_changed(const Document& document,
                                     ConstArrayView<Document::Change> changes) = 0;
protected:
    ~DocumentWatcher() = default;
};

}

#endif // document_hh_INCLUDED
