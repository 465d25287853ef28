#ifndef event_manager_hh_INCLUDED
#define event_manager_hh_INCLUDED

#include "safe_ptr.hh"
#include "vector.hh"

#include <functional>

namespace Bibsync
{

class EventManager;

// A unit of work to run after the current one completes.
//
// Scheduling an already pending task is a no-op, so any number of
// schedule() calls before the next turn result in a single run.
class DeferredTask
{
public:
    using Callback = std::function<void (DeferredTask& task)>;

    DeferredTask(EventManager& manager, Callback callback);
    DeferredTask(const DeferredTask&) = delete;
    DeferredTask& operator=(const DeferredTask&) = delete;
    ~DeferredTask();

    // returns false if the task was already pending
    bool schedule();
    bool is_pending() const { return m_pending; }

    void run();

private:
    EventManager& m_manager;
    Callback m_callback;
    bool m_pending = false;
};

// The EventManager is the cooperative scheduler of a session, the host
// calls handle_next_events() once its current transaction has settled.
class EventManager : public SafeCountable
{
public:
    EventManager() = default;
    ~EventManager();
    EventManager(const EventManager&) = delete;
    EventManager& operator=(const EventManager&) = delete;

    // runs the tasks pending when called, tasks scheduled meanwhile
    // wait for the next call. Returns true if any task ran.
    bool handle_next_events();

    // runs turns until no task is pending, returns the number of turns
    int run_until_idle();

    bool has_pending_events() const { return not m_queue.empty(); }

private:
    friend class DeferredTask;
    Vector<DeferredTask*, MemoryDomain::Events> m_tasks;
    Vector<DeferredTask*, MemoryDomain::Events> m_queue;
};

}

#endif // event_manager_hh_INCLUDED
