#pragma once

#include <cstdint>
#include <string>

namespace dispatch {

struct scheduler_params {
    // Capacity
    int max_tasks_per_agent;         // Concurrent assignments per agent

    // Health
    int64_t heartbeat_timeout_ms;    // Agents silent longer than this get no new work

    // Deadline urgency
    double deadline_horizon_s;       // Deadline factor = horizon / seconds left
    double max_deadline_factor;      // Cap on the deadline factor

    // Scoring weights
    double capability_weight;
    double load_weight;
    double priority_weight;
    double deadline_weight;

    // Logging
    std::string log_level;           // "debug", "info", "warn", "error", "none"
    std::string log_file;            // Empty = stderr
};

scheduler_params scheduler_default_params();

// Throws validation_error on out-of-range values
void validate_params(const scheduler_params& params);

// Missing keys keep their defaults. Throws validation_error on malformed input.
scheduler_params scheduler_params_from_json(const std::string& json_str);
scheduler_params scheduler_params_from_file(const std::string& path);

std::string scheduler_params_to_json(const scheduler_params& params);

// Apply log_level and log_file to the process-wide logger
bool apply_log_params(const scheduler_params& params);

} // namespace dispatch
