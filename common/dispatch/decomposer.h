#pragma once

#include "memory_store.h"
#include "scheduler.h"
#include "task.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dispatch {

// Task categories driving the decomposition templates
enum task_archetype {
    TASK_ARCHETYPE_CODE,
    TASK_ARCHETYPE_WRITING,
    TASK_ARCHETYPE_ANALYSIS,
    TASK_ARCHETYPE_GENERAL
};

const char* task_archetype_to_string(task_archetype archetype);

// First match wins: code > writing > analysis > general
task_archetype classify_task(const task& t);

// 1.0 x (1 + 0.2 x capability_count) x keyword multipliers, capped at 5.0
double estimate_complexity(const std::string& description, size_t capability_count);

// Splits composite tasks into ordered, dependency-linked subtasks and feeds
// them to the scheduler as their dependencies complete.
class task_decomposer {
public:
    // The scheduler must outlive the decomposer. store may be null.
    explicit task_decomposer(scheduler& sched, memory_store_i* store = nullptr);
    ~task_decomposer();

    task_decomposer(const task_decomposer&) = delete;
    task_decomposer& operator=(const task_decomposer&) = delete;

    // Expand the task into its archetype's chain and register every subtask.
    // Throws validation_error on a malformed task or one already decomposed.
    std::vector<sub_task> decompose_task(const task& t);

    // Assign, in step order, every pending subtask whose dependencies have all
    // completed. Updated status and agent are written back into the vector.
    // Returns the number of subtasks assigned.
    size_t assign_subtasks(std::vector<sub_task>& subtasks);

    // Returns false for an unknown subtask. Completing a subtask resubmits
    // every subtask that depends on it.
    bool update_subtask_status(const std::string& subtask_id, subtask_status status);

    // Scheduler assignment hook: marks a pending subtask in progress when the
    // scheduler places it from its backlog
    void handle_assignment(const task_assignment& assignment);

    // Sorted by step_number
    std::vector<sub_task> get_subtasks_for_task(const std::string& parent_task_id) const;

    std::optional<sub_task> get_subtask(const std::string& subtask_id) const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace dispatch
