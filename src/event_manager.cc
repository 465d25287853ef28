#include "event_manager.hh"

#include "ranges.hh"
#include "unit_tests.hh"

namespace Bibsync
{

DeferredTask::DeferredTask(EventManager& manager, Callback callback)
    : m_manager{manager}, m_callback{std::move(callback)}
{
    m_manager.m_tasks.push_back(this);
}

DeferredTask::~DeferredTask()
{
    unordered_erase(m_manager.m_tasks, this);
    auto& queue = m_manager.m_queue;
    if (auto it = find(queue, this); it != queue.end())
        queue.erase(it);
}

bool DeferredTask::schedule()
{
    if (m_pending)
        return false;
    m_pending = true;
    m_manager.m_queue.push_back(this);
    return true;
}

void DeferredTask::run()
{
    bib_assert(m_callback);
    m_pending = false;
    m_callback(*this);
}

EventManager::~EventManager()
{
    bib_assert(m_tasks.empty());
}

bool EventManager::handle_next_events()
{
    auto queue = std::move(m_queue);
    m_queue.clear();

    bool ran = false;
    for (auto* task : queue)
    {
        // a previous task might have destroyed this one
        if (not contains(m_tasks, task) or not task->is_pending())
            continue;
        task->run();
        ran = true;
    }
    return ran;
}

int EventManager::run_until_idle()
{
    int turns = 0;
    while (has_pending_events())
    {
        handle_next_events();
        ++turns;
    }
    return turns;
}

UnitTest test_deferred_task{[]{
    EventManager event_manager;
    int runs = 0;
    DeferredTask task{event_manager, [&](DeferredTask&) { ++runs; }};

    bib_assert(not event_manager.handle_next_events());
    bib_assert(task.schedule());
    bib_assert(not task.schedule());
    bib_assert(runs == 0 and task.is_pending());

    bib_assert(event_manager.handle_next_events());
    bib_assert(runs == 1 and not task.is_pending());
    bib_assert(not event_manager.handle_next_events());
    bib_assert(runs == 1);

    // rescheduling from the callback defers to the next turn
    int chained = 0;
    DeferredTask chain{event_manager, [&](DeferredTask& self) {
        if (++chained < 3)
            self.schedule();
    }};
    chain.schedule();
    bib_assert(event_manager.handle_next_events());
    bib_assert(chained == 1);
    bib_assert(event_manager.run_until_idle() == 2);
    bib_assert(chained == 3);

    {
        DeferredTask dropped{event_manager, [&](DeferredTask&) { ++runs; }};
        dropped.schedule();
    }
    bib_assert(not event_manager.has_pending_events());
    bib_assert(not event_manager.handle_next_events());
    bib_assert(runs == 1);
}};

}
