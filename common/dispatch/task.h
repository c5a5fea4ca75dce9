#pragma once

#include "capability.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace dispatch {

constexpr int TASK_PRIORITY_HIGHEST = 1;
constexpr int TASK_PRIORITY_LOWEST  = 5;
constexpr int64_t TASK_DEFAULT_TIMEOUT_MS = 3600000;  // 1 hour
constexpr int TASK_DEFAULT_MAX_RETRIES = 3;

// Unit of work requiring one or more capabilities
struct task {
    std::string task_id;                             // Unique task identifier
    std::vector<capability> required_capabilities;   // Earlier entries weigh more
    int priority = 3;                                // 1 (highest) to 5 (lowest)
    int64_t deadline = 0;                            // Unix epoch ms, 0 = no deadline
    int64_t timeout_ms = TASK_DEFAULT_TIMEOUT_MS;    // Max time an assignment may stay active
    int retry_count = 0;
    int max_retries = TASK_DEFAULT_MAX_RETRIES;
    std::map<std::string, std::string> metadata;
    int64_t created_at = 0;                          // Unix epoch ms

    // Throws validation_error on a blank id, empty or duplicated capabilities,
    // out-of-range priority, negative timeout or an inconsistent retry policy
    void validate() const;

    bool has_deadline() const { return deadline > 0; }

    std::string to_json() const;
};

enum subtask_status {
    SUBTASK_STATUS_PENDING,
    SUBTASK_STATUS_IN_PROGRESS,
    SUBTASK_STATUS_COMPLETED
};

const char* subtask_status_to_string(subtask_status status);
bool subtask_status_from_string(const std::string& str, subtask_status& status);

// A task produced by decomposing a parent task
struct sub_task : task {
    std::string parent_task_id;
    std::vector<std::string> dependencies;   // Subtask ids that must complete first
    int step_number = 0;                     // 1-based position in the chain
    subtask_status status = SUBTASK_STATUS_PENDING;
    std::string assigned_agent;              // Empty until assigned
    double estimated_complexity = 1.0;

    std::string to_json() const;
};

// Record binding a task to its currently responsible agent
struct task_assignment {
    task assigned_task;
    std::string agent_id;
    int64_t assigned_at = 0;
    double capability_match_score = 0.0;     // Weighted capability fit in [0, 1]
    double score = 0.0;                      // Final multi-criteria score
    int64_t completed_at = 0;                // 0 = not completed
    int64_t failed_at = 0;                   // 0 = not failed
    std::string failure_reason;

    bool is_completed() const { return completed_at > 0; }
    bool is_failed() const { return failed_at > 0; }

    std::string to_json() const;
};

} // namespace dispatch
