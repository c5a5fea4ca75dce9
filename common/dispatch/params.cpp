#include "params.h"
#include "log.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace dispatch {

scheduler_params scheduler_default_params() {
    scheduler_params params;

    params.max_tasks_per_agent = 3;

    params.heartbeat_timeout_ms = 5 * 60 * 1000;

    params.deadline_horizon_s = 86400.0;
    params.max_deadline_factor = 2.0;

    params.capability_weight = 0.35;
    params.load_weight = 0.25;
    params.priority_weight = 0.25;
    params.deadline_weight = 0.15;

    params.log_level = "info";
    params.log_file = "";

    return params;
}

void validate_params(const scheduler_params& params) {
    if (params.max_tasks_per_agent < 1) {
        throw validation_error("max_tasks_per_agent must be a positive integer");
    }
    if (params.heartbeat_timeout_ms < 0) {
        throw validation_error("heartbeat_timeout_ms must not be negative");
    }
    if (params.deadline_horizon_s <= 0.0) {
        throw validation_error("deadline_horizon_s must be positive");
    }
    if (params.max_deadline_factor < 0.0) {
        throw validation_error("max_deadline_factor must not be negative");
    }
    if (params.capability_weight < 0.0 || params.load_weight < 0.0 ||
        params.priority_weight < 0.0 || params.deadline_weight < 0.0) {
        throw validation_error("scoring weights must not be negative");
    }
    log_level level;
    if (!log_level_from_string(params.log_level, level)) {
        throw validation_error("unknown log_level: " + params.log_level);
    }
}

scheduler_params scheduler_params_from_json(const std::string& json_str) {
    scheduler_params params = scheduler_default_params();

    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            throw validation_error("scheduler params must be a JSON object");
        }

        params.max_tasks_per_agent = j.value("max_tasks_per_agent", params.max_tasks_per_agent);
        params.heartbeat_timeout_ms = j.value("heartbeat_timeout_ms", params.heartbeat_timeout_ms);
        params.deadline_horizon_s = j.value("deadline_horizon_s", params.deadline_horizon_s);
        params.max_deadline_factor = j.value("max_deadline_factor", params.max_deadline_factor);

        if (j.contains("weights")) {
            const auto& w = j.at("weights");
            params.capability_weight = w.value("capability", params.capability_weight);
            params.load_weight = w.value("load", params.load_weight);
            params.priority_weight = w.value("priority", params.priority_weight);
            params.deadline_weight = w.value("deadline", params.deadline_weight);
        }

        params.log_level = j.value("log_level", params.log_level);
        params.log_file = j.value("log_file", params.log_file);
    } catch (const json::exception& e) {
        throw validation_error(std::string("malformed scheduler params: ") + e.what());
    }

    validate_params(params);
    return params;
}

scheduler_params scheduler_params_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw validation_error("cannot open scheduler params file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return scheduler_params_from_json(ss.str());
}

std::string scheduler_params_to_json(const scheduler_params& params) {
    json j;
    j["max_tasks_per_agent"] = params.max_tasks_per_agent;
    j["heartbeat_timeout_ms"] = params.heartbeat_timeout_ms;
    j["deadline_horizon_s"] = params.deadline_horizon_s;
    j["max_deadline_factor"] = params.max_deadline_factor;
    j["weights"] = {
        {"capability", params.capability_weight},
        {"load", params.load_weight},
        {"priority", params.priority_weight},
        {"deadline", params.deadline_weight}
    };
    j["log_level"] = params.log_level;
    j["log_file"] = params.log_file;
    return j.dump(2);
}

bool apply_log_params(const scheduler_params& params) {
    log_level level;
    if (!log_level_from_string(params.log_level, level)) {
        LOG_WRN("unknown log level '%s', keeping %s\n", params.log_level.c_str(),
                log_level_to_string(dispatch_log_get_level()));
        return false;
    }
    dispatch_log_set_level(level);

    if (!dispatch_log_set_file(params.log_file)) {
        LOG_ERR("failed to open log file %s\n", params.log_file.c_str());
        return false;
    }
    return true;
}

} // namespace dispatch
