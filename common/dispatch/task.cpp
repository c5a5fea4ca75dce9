#include "task.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <set>

using json = nlohmann::json;

namespace dispatch {

static json task_to_json_obj(const task& t) {
    std::vector<std::string> caps;
    caps.reserve(t.required_capabilities.size());
    for (auto cap : t.required_capabilities) {
        caps.push_back(capability_to_string(cap));
    }

    return json{
        {"task_id", t.task_id},
        {"required_capabilities", caps},
        {"priority", t.priority},
        {"deadline", t.deadline},
        {"timeout_ms", t.timeout_ms},
        {"retry_count", t.retry_count},
        {"max_retries", t.max_retries},
        {"metadata", t.metadata},
        {"created_at", t.created_at}
    };
}

void task::validate() const {
    if (is_blank(task_id)) {
        throw validation_error("task_id must be a non-empty string");
    }

    if (required_capabilities.empty()) {
        throw validation_error("required_capabilities cannot be empty for task " + task_id);
    }

    std::set<capability> seen;
    for (auto cap : required_capabilities) {
        if (!is_valid_capability(cap)) {
            throw validation_error("invalid capability value in task " + task_id);
        }
        if (!seen.insert(cap).second) {
            throw validation_error(std::string("duplicate capability ") + capability_to_string(cap) +
                                   " in task " + task_id);
        }
    }

    if (priority < TASK_PRIORITY_HIGHEST || priority > TASK_PRIORITY_LOWEST) {
        throw validation_error("priority must be an integer between 1 and 5, got " + std::to_string(priority));
    }

    if (deadline < 0) {
        throw validation_error("deadline must not be negative");
    }

    if (timeout_ms < 0) {
        throw validation_error("timeout must not be negative");
    }

    if (max_retries < 0) {
        throw validation_error("max_retries must be a non-negative integer");
    }

    if (retry_count < 0 || retry_count > max_retries) {
        throw validation_error("retry_count must be between 0 and max_retries");
    }
}

std::string task::to_json() const {
    return task_to_json_obj(*this).dump();
}

const char* subtask_status_to_string(subtask_status status) {
    switch (status) {
        case SUBTASK_STATUS_PENDING:     return "pending";
        case SUBTASK_STATUS_IN_PROGRESS: return "in_progress";
        case SUBTASK_STATUS_COMPLETED:   return "completed";
        default:                         return "unknown";
    }
}

bool subtask_status_from_string(const std::string& str, subtask_status& status) {
    if (str == "pending")          status = SUBTASK_STATUS_PENDING;
    else if (str == "in_progress") status = SUBTASK_STATUS_IN_PROGRESS;
    else if (str == "completed")   status = SUBTASK_STATUS_COMPLETED;
    else return false;
    return true;
}

std::string sub_task::to_json() const {
    json j = task_to_json_obj(*this);
    j["parent_task_id"] = parent_task_id;
    j["dependencies"] = dependencies;
    j["step_number"] = step_number;
    j["status"] = subtask_status_to_string(status);
    j["assigned_agent"] = assigned_agent;
    j["estimated_complexity"] = estimated_complexity;
    return j.dump();
}

std::string task_assignment::to_json() const {
    json j;
    j["task"] = task_to_json_obj(assigned_task);
    j["agent_id"] = agent_id;
    j["assigned_at"] = assigned_at;
    j["capability_match_score"] = capability_match_score;
    j["score"] = score;
    j["completed_at"] = completed_at;
    j["failed_at"] = failed_at;
    j["failure_reason"] = failure_reason;
    return j.dump();
}

} // namespace dispatch
