#include "reconciler.hh"

#include "diff.hh"
#include "exception.hh"
#include "format.hh"
#include "ranges.hh"
#include "unit_tests.hh"

namespace Bibsync
{

ReconcilePlan plan_reconcile(ConstArrayView<String> old_keys, ConstArrayView<String> new_keys)
{
    using Type = ReconcileEdit::Type;
    ReconcilePlan removed;
    ReconcilePlan added;

    int i = 0, j = 0;
    for_each_diff(old_keys.begin(), (int)old_keys.size(),
                  new_keys.begin(), (int)new_keys.size(),
                  [&](DiffOp op, int len) {
        switch (op)
        {
            case DiffOp::Keep:
                i += len;
                j += len;
                break;
            case DiffOp::Remove:
                for (const int end = i + len; i < end; ++i)
                    removed.push_back({Type::Remove, old_keys[i], i});
                break;
            case DiffOp::Add:
                for (const int end = j + len; j < end; ++j)
                    added.push_back({Type::Insert, new_keys[j], -1, j});
                break;
        }
    });

    // a key removed at one place and added at another is moved
    for (auto& edit : added)
    {
        auto it = Bibsync::find_if(removed, [&](const ReconcileEdit& removal) { return removal.key == edit.key; });
        if (it == removed.end())
            continue;
        edit.type = Type::Move;
        edit.old_index = it->old_index;
        removed.erase(it);
    }

    ReconcilePlan res = std::move(removed);
    res.insert(res.end(), added.begin(), added.end());
    return res;
}

ReconcilePlan reconcile(Document& document, StringView container_id,
                        StringView child_type, StringView key_attribute,
                        ConstArrayView<String> old_keys, ConstArrayView<String> new_keys)
{
    using Type = ReconcileEdit::Type;
    auto is_typed = [&](const NodeId& id) { return document.node(id).type == child_type; };

    const NodeIdList old_nodes = document.children(container_id) | filter(is_typed) | gather<NodeIdList>();
    bool matching = old_nodes.size() == old_keys.size();
    for (size_t i = 0; matching and i < old_nodes.size(); ++i)
        matching = document.node(old_nodes[i]).attribute(key_attribute) == old_keys[i];
    if (not matching)
        throw runtime_error(format("children of '{}' do not match the expected keys", container_id));

    auto plan = plan_reconcile(old_keys, new_keys);

    // node and edit for each new index, kept nodes have no edit
    NodeIdList new_nodes(new_keys.size());
    Vector<const ReconcileEdit*, MemoryDomain::Document> new_edits(new_keys.size(), nullptr);
    Vector<bool, MemoryDomain::Document> old_edited(old_keys.size(), false);
    for (auto& edit : plan)
    {
        if (edit.old_index >= 0)
            old_edited[edit.old_index] = true;
        if (edit.new_index >= 0)
        {
            new_edits[edit.new_index] = &edit;
            if (edit.type == Type::Move)
                new_nodes[edit.new_index] = old_nodes[edit.old_index];
        }
    }
    for (size_t i = 0, j = 0; i < old_nodes.size(); ++i)
    {
        if (old_edited[i])
            continue;
        while (new_edits[j])
            ++j;
        new_nodes[j++] = old_nodes[i];
    }

    for (auto& edit : plan)
    {
        if (edit.type == Type::Remove)
            document.delete_node(old_nodes[edit.old_index]);
    }

    for (size_t j = 0; j < new_nodes.size(); ++j)
    {
        auto* edit = new_edits[j];
        if (not edit)
            continue;

        const auto& siblings = document.children(container_id);
        auto index_of = [&](const NodeId& id) { return (int)(Bibsync::find(siblings, id) - siblings.begin()); };

        // position to insert at in the current children
        int target;
        if (j == 0)
        {
            auto it = Bibsync::find_if(siblings, [&](const NodeId& id) { return id != new_nodes[0] and is_typed(id); });
            target = (int)(it - siblings.begin());
        }
        else
            target = index_of(new_nodes[j-1]) + 1;

        if (edit->type == Type::Insert)
        {
            new_nodes[j] = document.create_node(container_id, target, child_type,
                                                {{key_attribute.str(), new_keys[j]}}).id;
            continue;
        }

        const int current = index_of(new_nodes[j]);
        if (j == 0 and current < target)
            continue;
        document.move_node(new_nodes[j], current < target ? target - 1 : target);
    }

    document.commit();
    return plan;
}

namespace
{

struct ReconcileFixture
{
    using RidKeys = Vector<String, MemoryDomain::Document>;

    ReconcileFixture(std::initializer_list<StringView> keys)
    {
        doc.create_node("root", -1, "ref-list", {}, "refs");
        doc.create_node("refs", -1, "title", {}, "title");
        for (auto key : keys)
            doc.create_node("refs", -1, "ref", {{"rid", key.str()}}, format("r{}", key));
        doc.commit();
    }

    RidKeys keys() const
    {
        return doc.children("refs")
             | filter([this](const NodeId& id) { return doc.node(id).type == "ref"; })
             | transform([this](const NodeId& id) { return doc.node(id).attribute("rid"); })
             | gather<RidKeys>();
    }

    ReconcilePlan update(std::initializer_list<StringView> new_keys)
    {
        auto old = keys();
        auto wanted = new_keys | gather<RidKeys>();
        auto plan = reconcile(doc, "refs", "ref", "rid", old, wanted);
        bib_assert(keys() == wanted);
        bib_assert(doc.children("refs")[0] == "title");
        return plan;
    }

    static int count(const ReconcilePlan& plan, ReconcileEdit::Type type)
    {
        return (int)std::count_if(plan.begin(), plan.end(), [type](const ReconcileEdit& edit) { return edit.type == type; });
    }

    Document doc;
};

}

UnitTest test_reconcile_minimal_edits{[]{
    using Type = ReconcileEdit::Type;

    ReconcileFixture fixture{"A", "B", "C"};
    const auto timestamp = fixture.doc.timestamp();
    auto plan = fixture.update({"B", "C", "D"});
    bib_assert(ReconcileFixture::count(plan, Type::Remove) == 1);
    bib_assert(ReconcileFixture::count(plan, Type::Insert) == 1);
    bib_assert(ReconcileFixture::count(plan, Type::Move) == 0);
    bib_assert(fixture.doc.timestamp() == timestamp + 1);
    bib_assert(fixture.doc.changes_since(timestamp).size() == 2);

    auto& children = fixture.doc.children("refs");
    bib_assert(children[1] == "rB" and children[2] == "rC");
    bib_assert(fixture.doc.get("rA") == nullptr);
    bib_assert(fixture.doc.node(children[3]).attribute("rid") == "D");

    // unchanged keys, nothing is committed
    plan = fixture.update({"B", "C", "D"});
    bib_assert(plan.empty());
    bib_assert(fixture.doc.timestamp() == timestamp + 1);
}};

UnitTest test_reconcile_moves{[]{
    using Type = ReconcileEdit::Type;

    ReconcileFixture rotation{"A", "B", "C"};
    auto plan = rotation.update({"B", "C", "A"});
    bib_assert(plan.size() == 1 and plan[0].type == Type::Move and plan[0].key == "A");
    bib_assert((rotation.doc.children("refs") == NodeIdList{"title", "rB", "rC", "rA"}));

    ReconcileFixture pair{"A", "B"};
    plan = pair.update({"B", "A"});
    bib_assert(plan.size() == 1 and plan[0].type == Type::Move);
    bib_assert((pair.doc.children("refs") == NodeIdList{"title", "rB", "rA"}));

    ReconcileFixture reversal{"A", "B", "C", "D", "E"};
    plan = reversal.update({"E", "D", "C", "B", "A"});
    bib_assert(ReconcileFixture::count(plan, Type::Move) == 4 and plan.size() == 4);
    bib_assert((reversal.doc.children("refs") == NodeIdList{"title", "rE", "rD", "rC", "rB", "rA"}));

    ReconcileFixture mixed{"A", "B", "C", "D"};
    plan = mixed.update({"D", "X", "A", "C"});
    bib_assert(ReconcileFixture::count(plan, Type::Remove) == 1);
    bib_assert(ReconcileFixture::count(plan, Type::Insert) == 1);
    bib_assert(ReconcileFixture::count(plan, Type::Move) == 1);
    bib_assert(mixed.doc.get("rA") and mixed.doc.get("rC") and mixed.doc.get("rD"));
}};

UnitTest test_reconcile_replacement{[]{
    using Type = ReconcileEdit::Type;

    ReconcileFixture replaced{"A", "B"};
    auto plan = replaced.update({"C", "D"});
    bib_assert(ReconcileFixture::count(plan, Type::Remove) == 2 and ReconcileFixture::count(plan, Type::Insert) == 2);

    ReconcileFixture empty{};
    plan = empty.update({"A"});
    bib_assert(plan.size() == 1 and plan[0].type == Type::Insert and plan[0].new_index == 0);
    plan = empty.update({});
    bib_assert(plan.size() == 1 and plan[0].type == Type::Remove);
    bib_assert((empty.doc.children("refs") == NodeIdList{"title"}));

    ReconcileFixture fixture{"A", "B"};
    ReconcileFixture::RidKeys wrong{"B", "A"};
    bib_expect_throw(runtime_error, reconcile(fixture.doc, "refs", "ref", "rid", wrong, {}));
    bib_expect_throw(runtime_error, reconcile(fixture.doc, "nowhere", "ref", "rid", {}, {}));
}};

}
