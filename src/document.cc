#include "document.hh"

#include "exception.hh"
#include "format.hh"
#include "ranges.hh"
#include "selector.hh"
#include "unit_tests.hh"
#include "utils.hh"

namespace Bibsync
{

const String* Node::find_attribute(StringView name) const
{
    auto it = Bibsync::find_if(attributes, [&](const Attribute& attr) { return attr.name == name; });
    return it != attributes.end() ? &it->value : nullptr;
}

StringView Node::attribute(StringView name) const
{
    auto* value = find_attribute(name);
    return value ? StringView{*value} : StringView{};
}

Document::Document(String root_type)
{
    auto root = std::make_unique<Node>("root", std::move(root_type), AttributeList{}, NodeId{});
    m_root = root.get();
    m_nodes.emplace(m_root->id, std::move(root));
}

Document::~Document()
{
    bib_assert(m_watchers.empty());
}

const Node* Document::get(StringView id) const
{
    if (id.empty())
        return nullptr;
    auto it = m_nodes.find(id.str());
    return it != m_nodes.end() ? it->second.get() : nullptr;
}

const Node& Document::node(StringView id) const
{
    if (auto* res = get(id))
        return *res;
    throw runtime_error(format("no such node: '{}'", id));
}

Node& Document::mutable_node(StringView id)
{
    return const_cast<Node&>(node(id));
}

int Document::index_of(const Node& node) const
{
    auto* parent = get(node.parent);
    if (not parent)
        return -1;
    auto it = Bibsync::find(parent->children, node.id);
    return it != parent->children.end() ? (int)(it - parent->children.begin()) : -1;
}

template<typename Func>
bool Document::visit(const Node& node, Func&& func) const
{
    if (not func(node))
        return false;
    for (auto& child : node.children)
    {
        if (not visit(*m_nodes.at(child), func))
            return false;
    }
    return true;
}

const Node* Document::find(const Selector& selector) const
{
    const Node* res = nullptr;
    visit(*m_root, [&](const Node& node) {
        if (selector.matches(*this, node))
            res = &node;
        return res == nullptr;
    });
    return res;
}

const Node* Document::find(StringView selector) const
{
    return find(Selector::parse(selector));
}

Vector<const Node*, MemoryDomain::Document> Document::find_all(const Selector& selector) const
{
    Vector<const Node*, MemoryDomain::Document> res;
    visit(*m_root, [&](const Node& node) {
        if (selector.matches(*this, node))
            res.push_back(&node);
        return true;
    });
    return res;
}

Vector<const Node*, MemoryDomain::Document> Document::find_all(StringView selector) const
{
    return find_all(Selector::parse(selector));
}

NodeId Document::generate_id(StringView type)
{
    NodeId id;
    do
        id = format("{}-{}", type, ++m_next_id);
    while (m_nodes.contains(id));
    return id;
}

const Node& Document::create_node(StringView parent_id, int index, StringView type,
                                  AttributeList attributes, StringView id)
{
    if (type.empty())
        throw runtime_error("node type cannot be empty");

    Node& parent = mutable_node(parent_id);
    const int child_count = (int)parent.children.size();
    if (index < 0)
        index = child_count;
    else if (index > child_count)
        throw runtime_error(format("index {} out of range for node '{}'", index, parent_id));

    NodeId node_id = id.empty() ? generate_id(type) : id.str();
    if (m_nodes.contains(node_id))
        throw runtime_error(format("node '{}' already exists", node_id));

    auto node = std::make_unique<Node>(node_id, type.str(), std::move(attributes), parent.id);
    Node& res = *node;
    m_nodes.emplace(node_id, std::move(node));
    parent.children.insert(parent.children.begin() + index, node_id);

    Change change{Change::Type::Create, node_id, res.type, parent.id, res.attributes};
    change.new_index = index;
    m_pending.push_back(std::move(change));
    return res;
}

void Document::delete_subtree(Node& node)
{
    while (not node.children.empty())
    {
        Node& child = *m_nodes.at(node.children.back());
        delete_subtree(child);
    }

    const int index = index_of(node);
    Change change{Change::Type::Delete, node.id, node.type, node.parent, node.attributes};
    change.old_index = index;
    m_pending.push_back(std::move(change));

    if (index >= 0)
    {
        auto& siblings = m_nodes.at(node.parent)->children;
        siblings.erase(siblings.begin() + index);
    }
    NodeId id = node.id;
    m_nodes.erase(id);
}

void Document::delete_node(StringView id)
{
    Node& node = mutable_node(id);
    if (&node == m_root)
        throw runtime_error("cannot delete the document root");
    delete_subtree(node);
}

void Document::set_attribute(StringView id, StringView name, StringView value)
{
    if (name.empty())
        throw runtime_error("attribute name cannot be empty");

    Node& node = mutable_node(id);
    String old_value;
    if (auto it = Bibsync::find_if(node.attributes, [&](const Attribute& attr) { return attr.name == name; });
        it != node.attributes.end())
    {
        if (it->value == value)
            return;
        old_value = std::exchange(it->value, value.str());
    }
    else
        node.attributes.push_back({name.str(), value.str()});

    Change change{Change::Type::Set, node.id, node.type, node.parent};
    change.attribute = name.str();
    change.old_value = std::move(old_value);
    change.new_value = value.str();
    m_pending.push_back(std::move(change));
}

void Document::move_node(StringView id, int index)
{
    Node& node = mutable_node(id);
    auto* parent = get(node.parent);
    if (not parent)
        throw runtime_error("cannot move the document root");

    auto& siblings = mutable_node(node.parent).children;
    if (index < 0 or index >= (int)siblings.size())
        throw runtime_error(format("index {} out of range for node '{}'", index, node.parent));

    const int old_index = index_of(node);
    if (old_index == index)
        return;

    NodeId node_id = node.id;
    siblings.erase(siblings.begin() + old_index);
    siblings.insert(siblings.begin() + index, node_id);

    Change change{Change::Type::Move, node.id, node.type, node.parent};
    change.old_index = old_index;
    change.new_index = index;
    m_pending.push_back(std::move(change));
}

size_t Document::commit()
{
    if (m_pending.empty())
        return timestamp();

    ChangeList changes = std::move(m_pending);
    m_pending.clear();

    m_commit_offsets.push_back(m_history.size());
    m_history.insert(m_history.end(), changes.begin(), changes.end());

    // watchers may unregister themselves while being notified
    auto watchers = m_watchers;
    for (auto* watcher : watchers)
    {
        if (contains(m_watchers, watcher))
            watcher->on_document_changed(*this, changes);
    }
    return timestamp();
}

ConstArrayView<Document::Change> Document::changes_since(size_t timestamp) const
{
    if (timestamp >= m_commit_offsets.size())
        return {};
    return ConstArrayView<Change>{m_history}.subrange(m_commit_offsets[timestamp]);
}

void Document::register_watcher(DocumentWatcher& watcher) const
{
    bib_assert(not contains(m_watchers, &watcher));
    m_watchers.push_back(&watcher);
}

void Document::unregister_watcher(DocumentWatcher& watcher) const
{
    auto it = Bibsync::find(m_watchers, &watcher);
    bib_assert(it != m_watchers.end());
    m_watchers.erase(it);
}

UnitTest test_document_nodes{[]{
    Document doc{"article"};
    bib_assert(doc.root().type == "article");

    auto& body = doc.create_node("root", -1, "body", {}, "body");
    auto& first = doc.create_node("body", -1, "xref", {{"ref-type", "bibr"}, {"rid", "r1 r2"}});
    auto& second = doc.create_node("body", 0, "xref", {{"ref-type", "fig"}});
    bib_assert(first.id == "xref-1");
    bib_assert(body.children.size() == 2 and body.children[0] == second.id);
    bib_assert(doc.index_of(first) == 1);
    bib_assert(first.attribute("rid") == "r1 r2");
    bib_assert(first.attribute("label").empty() and not first.find_attribute("label"));

    bib_expect_throw(runtime_error, doc.create_node("body", -1, "p", {}, "body"));
    bib_expect_throw(runtime_error, doc.create_node("missing", -1, "p"));
    bib_expect_throw(runtime_error, doc.create_node("body", 5, "p"));
    bib_expect_throw(runtime_error, doc.delete_node("root"));

    doc.move_node(first.id, 0);
    bib_assert(body.children[0] == "xref-1");
    bib_expect_throw(runtime_error, doc.move_node("xref-1", 2));

    doc.set_attribute("xref-1", "rid", "r3");
    doc.set_attribute("xref-1", "rid", "r3");
    bib_assert(doc.get("xref-1")->attribute("rid") == "r3");
    bib_assert(doc.pending_changes().size() == 5);

    auto* found = doc.find("xref[ref-type='fig']");
    bib_assert(found and found->id == second.id);
    bib_assert(doc.find_all("body > xref").size() == 2);
    bib_assert(doc.find_all("article xref[rid]").size() == 1);
    bib_assert(doc.find("ref-list") == nullptr);

    doc.delete_node("body");
    bib_assert(doc.get("xref-1") == nullptr and doc.get("body") == nullptr);
    bib_assert(doc.root().children.empty());
    auto pending = doc.pending_changes();
    bib_assert(pending.size() == 8);
    bib_assert(pending.back().type == Document::Change::Type::Delete and pending.back().node == "body");
    bib_assert(pending[5].node == "xref-2" and pending[5].attributes.size() == 1);
}};

UnitTest test_document_memory{[]{
    auto& stats = memory_stats[(size_t)MemoryDomain::Document];
    const size_t allocations = stats.allocation_count;
    {
        Document doc;
        doc.create_node("root", -1, "ref-list", {}, "refs");
        doc.create_node("refs", -1, "ref", {{"rid", "A"}});
        doc.commit();
        bib_assert(stats.allocation_count > allocations);
    }
    bib_assert(stats.allocation_count == allocations);
}};

UnitTest test_document_commits{[]{
    struct Watcher : DocumentWatcher
    {
        void on_document_changed(const Document&, ConstArrayView<Document::Change> changes) override
        {
            batches.push_back(changes.size());
        }
        Vector<size_t> batches;
    } watcher;

    Document doc;
    doc.register_watcher(watcher);
    auto on_exit = on_scope_end([&] { doc.unregister_watcher(watcher); });

    bib_assert(doc.commit() == 0);
    auto& list = doc.create_node("root", -1, "ref-list", {}, "refs");
    doc.create_node(list.id, -1, "ref", {{"rid", "A"}});
    bib_assert(doc.commit() == 1);
    doc.set_attribute("refs", "title", "References");
    bib_assert(doc.commit() == 2);

    bib_assert(watcher.batches.size() == 2 and watcher.batches[0] == 2 and watcher.batches[1] == 1);
    bib_assert(doc.changes_since(0).size() == 3);
    bib_assert(doc.changes_since(1).size() == 1);
    bib_assert(doc.changes_since(1)[0].type == Document::Change::Type::Set);
    bib_assert(doc.changes_since(1)[0].new_value == "References");
    bib_assert(doc.changes_since(2).empty());
    bib_assert(not doc.has_pending_changes());
}};

}
