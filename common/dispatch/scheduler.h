#pragma once

#include "capability.h"
#include "memory_store.h"
#include "params.h"
#include "task.h"
#include "util.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dispatch {

// Assigns tasks to capability-tagged agents.
//
// Candidates are agents with a recent heartbeat and spare capacity that hold
// every required capability. Each is scored on capability fit, current load,
// task priority and deadline urgency; the highest score wins and ties go to
// the lowest agent_id. Unassignable tasks wait in a backlog ordered by
// (priority, insertion order) that is drained whenever a task completes.
// Timed-out or failed assignments are retried with raised priority until
// max_retries is exhausted, after which they are kept as permanently failed.
//
// Every public call takes one lock for its whole duration. Memory store
// writes, log output and the assignment callback run after the lock is
// released; their failures are logged and never propagated.
class scheduler {
public:
    using assignment_callback = std::function<void(const task_assignment&)>;

    // The registry must outlive the scheduler. store may be null.
    scheduler(capability_registry& registry,
              const scheduler_params& params = scheduler_default_params(),
              memory_store_i* store = nullptr,
              clock_fn clock = nullptr);
    ~scheduler();

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;

    // Assign the task to the best agent. Returns the agent id, or nullopt when
    // no agent qualifies (the task is then queued) or the deadline has already
    // passed (not queued). Throws validation_error on malformed input, on a
    // task that is already active and on a permanently failed task.
    std::optional<std::string> assign_task(const task& t);

    // Fail every assignment whose timeout has elapsed ("timed out", retried).
    // Returns the number of assignments timed out.
    size_t check_task_timeouts();

    // Finish an active assignment, then drain the backlog. Returns false if
    // the agent does not hold the task.
    bool complete_task(const std::string& agent_id,
                       const std::string& task_id,
                       const std::optional<std::string>& result = std::nullopt);

    // Fail an active assignment. With retry and retries left the task is
    // requeued one priority level higher, otherwise it is permanently failed.
    bool fail_task(const std::string& agent_id,
                   const std::string& task_id,
                   const std::string& reason,
                   bool retry = true);

    // Resubmit permanently failed tasks that still have retries left.
    // Returns the number of tasks resubmitted.
    size_t retry_failed_tasks();

    // Assign queued tasks in order until one cannot be placed. Returns the
    // number assigned.
    size_t process_backlog();

    // Record a heartbeat
    void update_agent_health(const std::string& agent_id);

    bool is_agent_healthy(const std::string& agent_id) const;

    // Queries
    std::vector<task> get_agent_tasks(const std::string& agent_id) const;
    std::optional<std::string> get_task_agent(const std::string& task_id) const;
    std::vector<task_assignment> get_task_history(const std::string& task_id) const;
    std::vector<task> get_queued_tasks() const;
    std::map<std::string, task_assignment> get_failed_tasks() const;
    size_t get_active_count() const;

    // JSON summary: active/queued/failed counts and per-agent load
    std::string get_stats() const;

    // Invoked after the lock is released for every new assignment
    void set_assignment_callback(assignment_callback callback);

    const scheduler_params& get_params() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace dispatch
