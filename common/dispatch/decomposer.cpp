#include "decomposer.h"
#include "log.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>

using json = nlohmann::json;

namespace dispatch {

namespace {

enum step_caps_kind {
    STEP_CAPS_FIXED,    // One fixed capability
    STEP_CAPS_FILTER,   // Parent capabilities whose name contains the filter
    STEP_CAPS_PARENT    // All parent capabilities
};

struct step_template {
    const char* suffix;
    const char* description;
    step_caps_kind kind;
    capability fixed;
    const char* filter;
    bool only_if_optimize;  // Emitted only when an optimization capability was requested
};

const step_template code_steps[] = {
    {"analysis",  "Analyze requirements and plan implementation approach", STEP_CAPS_FIXED,  CAPABILITY_CRITICAL_ANALYSIS,  nullptr, false},
    {"implement", "Implement the planned solution",                        STEP_CAPS_FILTER, CAPABILITY_CODE_GENERATION,   "code",  false},
    {"test",      "Test implementation and review code quality",           STEP_CAPS_FIXED,  CAPABILITY_CODE_REVIEW,       nullptr, false},
    {"optimize",  "Optimize code for better performance",                  STEP_CAPS_FIXED,  CAPABILITY_CODE_OPTIMIZATION, nullptr, true},
};

const step_template writing_steps[] = {
    {"research", "Research and gather information", STEP_CAPS_FIXED,  CAPABILITY_RESEARCH,          nullptr,   false},
    {"outline",  "Create detailed outline",         STEP_CAPS_FILTER, CAPABILITY_TECHNICAL_WRITING, "writing", false},
    {"write",    "Write initial content",           STEP_CAPS_PARENT, CAPABILITY_TECHNICAL_WRITING, nullptr,   false},
    {"review",   "Review and refine content",       STEP_CAPS_FIXED,  CAPABILITY_CRITICAL_ANALYSIS, nullptr,   false},
};

const step_template analysis_steps[] = {
    {"gather",     "Gather relevant data and information",    STEP_CAPS_FIXED,  CAPABILITY_RESEARCH,          nullptr,    false},
    {"analyze",    "Analyze gathered information",            STEP_CAPS_FILTER, CAPABILITY_DATA_ANALYSIS,     "analysis", false},
    {"synthesize", "Synthesize findings and draw conclusions", STEP_CAPS_FIXED,  CAPABILITY_CRITICAL_ANALYSIS, nullptr,    false},
    {"report",     "Create detailed report of findings",      STEP_CAPS_FIXED,  CAPABILITY_TECHNICAL_WRITING, nullptr,    false},
};

const step_template general_steps[] = {
    {"plan",    "Plan approach and identify requirements", STEP_CAPS_FIXED,  CAPABILITY_CRITICAL_ANALYSIS, nullptr, false},
    {"execute", "Execute planned approach",                STEP_CAPS_PARENT, CAPABILITY_CRITICAL_ANALYSIS, nullptr, false},
    {"review",  "Review results and ensure quality",       STEP_CAPS_FIXED,  CAPABILITY_CRITICAL_ANALYSIS, nullptr, false},
};

struct complexity_keyword {
    const char* keyword;
    double multiplier;
};

const complexity_keyword complexity_keywords[] = {
    {"optimize",  1.5},
    {"improve",   1.3},
    {"refactor",  1.4},
    {"design",    1.3},
    {"implement", 1.2},
    {"test",      1.1},
    {"debug",     1.3},
    {"analyze",   1.2},
    {"research",  1.3},
};

constexpr double MAX_COMPLEXITY = 5.0;

bool has_any(const task& t, std::initializer_list<capability> caps) {
    for (auto cap : caps) {
        if (std::find(t.required_capabilities.begin(), t.required_capabilities.end(), cap) !=
            t.required_capabilities.end()) {
            return true;
        }
    }
    return false;
}

bool name_contains(capability cap, const char* needle) {
    return std::string(capability_to_string(cap)).find(needle) != std::string::npos;
}

std::vector<capability> step_capabilities(const step_template& step, const task& parent) {
    switch (step.kind) {
        case STEP_CAPS_FIXED:
            return {step.fixed};
        case STEP_CAPS_FILTER: {
            std::vector<capability> caps;
            for (auto cap : parent.required_capabilities) {
                if (name_contains(cap, step.filter)) {
                    caps.push_back(cap);
                }
            }
            // An empty subset would make the step unassignable
            if (caps.empty()) {
                return parent.required_capabilities;
            }
            return caps;
        }
        case STEP_CAPS_PARENT:
            return parent.required_capabilities;
    }
    return parent.required_capabilities;
}

std::string progress_json(const sub_task& st) {
    json j;
    j["status"] = subtask_status_to_string(st.status);
    j["parent_task_id"] = st.parent_task_id;
    j["step_number"] = st.step_number;
    j["assigned_agent"] = st.assigned_agent;
    j["complexity"] = st.estimated_complexity;
    j["dependencies"] = st.dependencies;
    auto desc = st.metadata.find("description");
    if (desc != st.metadata.end()) {
        j["description"] = desc->second;
    }
    return j.dump();
}

} // namespace

const char* task_archetype_to_string(task_archetype archetype) {
    switch (archetype) {
        case TASK_ARCHETYPE_CODE:     return "code";
        case TASK_ARCHETYPE_WRITING:  return "writing";
        case TASK_ARCHETYPE_ANALYSIS: return "analysis";
        case TASK_ARCHETYPE_GENERAL:  return "general";
        default:                      return "unknown";
    }
}

task_archetype classify_task(const task& t) {
    if (has_any(t, {CAPABILITY_CODE_GENERATION, CAPABILITY_CODE_REVIEW, CAPABILITY_CODE_OPTIMIZATION})) {
        return TASK_ARCHETYPE_CODE;
    }
    if (has_any(t, {CAPABILITY_TECHNICAL_WRITING, CAPABILITY_CREATIVE_WRITING})) {
        return TASK_ARCHETYPE_WRITING;
    }
    if (has_any(t, {CAPABILITY_DATA_ANALYSIS, CAPABILITY_CRITICAL_ANALYSIS, CAPABILITY_RESEARCH})) {
        return TASK_ARCHETYPE_ANALYSIS;
    }
    return TASK_ARCHETYPE_GENERAL;
}

double estimate_complexity(const std::string& description, size_t capability_count) {
    std::string lower = description;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    double complexity = 1.0 * (1.0 + 0.2 * static_cast<double>(capability_count));
    for (const auto& kw : complexity_keywords) {
        if (lower.find(kw.keyword) != std::string::npos) {
            complexity *= kw.multiplier;
        }
    }
    return std::min(complexity, MAX_COMPLEXITY);
}

struct task_decomposer::impl {
    scheduler& sched;
    memory_store_i* store;

    std::map<std::string, sub_task> subtasks;
    mutable std::mutex mutex;

    impl(scheduler& sched, memory_store_i* store) : sched(sched), store(store) {}

    bool dependencies_met_locked(const sub_task& st) const {
        for (const auto& dep : st.dependencies) {
            auto it = subtasks.find(dep);
            if (it == subtasks.end() || it->second.status != SUBTASK_STATUS_COMPLETED) {
                return false;
            }
        }
        return true;
    }

    void record_progress(const std::vector<sub_task>& changed) {
        if (!store) {
            return;
        }
        for (const auto& st : changed) {
            try {
                store->store(st.task_id, "subtask_progress", progress_json(st));
            } catch (const std::exception& e) {
                LOG_ERR("failed to store progress for subtask %s: %s\n", st.task_id.c_str(), e.what());
            }
        }
    }
};

task_decomposer::task_decomposer(scheduler& sched, memory_store_i* store)
    : pimpl(std::make_unique<impl>(sched, store)) {}

task_decomposer::~task_decomposer() = default;

std::vector<sub_task> task_decomposer::decompose_task(const task& t) {
    t.validate();

    const task_archetype archetype = classify_task(t);

    const step_template* steps = nullptr;
    size_t n_steps = 0;
    switch (archetype) {
        case TASK_ARCHETYPE_CODE:
            steps = code_steps;
            n_steps = sizeof(code_steps) / sizeof(code_steps[0]);
            break;
        case TASK_ARCHETYPE_WRITING:
            steps = writing_steps;
            n_steps = sizeof(writing_steps) / sizeof(writing_steps[0]);
            break;
        case TASK_ARCHETYPE_ANALYSIS:
            steps = analysis_steps;
            n_steps = sizeof(analysis_steps) / sizeof(analysis_steps[0]);
            break;
        case TASK_ARCHETYPE_GENERAL:
            steps = general_steps;
            n_steps = sizeof(general_steps) / sizeof(general_steps[0]);
            break;
    }

    bool wants_optimize = false;
    for (auto cap : t.required_capabilities) {
        if (name_contains(cap, "optimiz")) {
            wants_optimize = true;
        }
    }

    const int64_t now = get_timestamp_ms();
    std::vector<sub_task> result;
    for (size_t i = 0; i < n_steps; i++) {
        const step_template& step = steps[i];
        if (step.only_if_optimize && !wants_optimize) {
            continue;
        }

        sub_task st;
        st.task_id = t.task_id + "_" + step.suffix;
        st.required_capabilities = step_capabilities(step, t);
        st.priority = t.priority;
        st.deadline = t.deadline;
        st.timeout_ms = t.timeout_ms;
        st.max_retries = t.max_retries;
        st.created_at = now;
        st.metadata["description"] = step.description;
        st.metadata["archetype"] = task_archetype_to_string(archetype);
        st.parent_task_id = t.task_id;
        st.step_number = static_cast<int>(result.size()) + 1;
        if (!result.empty()) {
            st.dependencies.push_back(result.back().task_id);
        }
        st.estimated_complexity = estimate_complexity(step.description, st.required_capabilities.size());
        result.push_back(st);
    }

    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        for (const auto& st : result) {
            if (pimpl->subtasks.count(st.task_id)) {
                throw validation_error("task " + t.task_id + " has already been decomposed");
            }
        }
        for (const auto& st : result) {
            pimpl->subtasks[st.task_id] = st;
        }
    }

    pimpl->record_progress(result);
    LOG_INF("task %s (%s) decomposed into %zu subtasks\n",
            t.task_id.c_str(), task_archetype_to_string(archetype), result.size());
    return result;
}

size_t task_decomposer::assign_subtasks(std::vector<sub_task>& subtasks) {
    std::stable_sort(subtasks.begin(), subtasks.end(),
                     [](const sub_task& a, const sub_task& b) { return a.step_number < b.step_number; });

    size_t assigned = 0;
    for (auto& requested : subtasks) {
        sub_task current;
        bool known = false;
        bool ready = false;
        {
            std::lock_guard<std::mutex> lock(pimpl->mutex);
            auto it = pimpl->subtasks.find(requested.task_id);
            if (it != pimpl->subtasks.end()) {
                known = true;
                current = it->second;
                requested = current;
                ready = current.status == SUBTASK_STATUS_PENDING && pimpl->dependencies_met_locked(current);
            }
        }

        if (!known) {
            LOG_WRN("subtask %s was never decomposed, skipping\n", requested.task_id.c_str());
            continue;
        }
        if (!ready) {
            if (current.status == SUBTASK_STATUS_PENDING) {
                LOG_DBG("subtask %s waiting for dependencies\n", current.task_id.c_str());
            }
            continue;
        }

        // Placed by the scheduler since the last pass
        std::optional<std::string> agent_id = pimpl->sched.get_task_agent(current.task_id);
        if (!agent_id) {
            try {
                agent_id = pimpl->sched.assign_task(current);
            } catch (const validation_error& e) {
                LOG_WRN("subtask %s rejected by scheduler: %s\n", current.task_id.c_str(), e.what());
                continue;
            }
        }
        if (!agent_id) {
            LOG_WRN("no suitable agent for subtask %s, left pending\n", current.task_id.c_str());
            continue;
        }

        sub_task updated;
        {
            std::lock_guard<std::mutex> lock(pimpl->mutex);
            auto& st = pimpl->subtasks.at(current.task_id);
            if (st.status == SUBTASK_STATUS_PENDING) {
                st.status = SUBTASK_STATUS_IN_PROGRESS;
            }
            st.assigned_agent = *agent_id;
            updated = st;
        }

        requested = updated;
        pimpl->record_progress({updated});
        assigned++;
        LOG_INF("subtask %s assigned to agent %s\n", updated.task_id.c_str(), agent_id->c_str());
    }
    return assigned;
}

bool task_decomposer::update_subtask_status(const std::string& subtask_id, subtask_status status) {
    sub_task updated;
    std::vector<sub_task> dependents;
    subtask_status old_status = SUBTASK_STATUS_PENDING;
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->subtasks.find(subtask_id);
        if (it != pimpl->subtasks.end()) {
            known = true;
            old_status = it->second.status;
            it->second.status = status;
            updated = it->second;

            if (status == SUBTASK_STATUS_COMPLETED) {
                for (const auto& [id, st] : pimpl->subtasks) {
                    if (st.status == SUBTASK_STATUS_PENDING &&
                        std::find(st.dependencies.begin(), st.dependencies.end(), subtask_id) != st.dependencies.end()) {
                        dependents.push_back(st);
                    }
                }
            }
        }
    }

    if (!known) {
        LOG_WRN("status update for unknown subtask %s\n", subtask_id.c_str());
        return false;
    }

    pimpl->record_progress({updated});
    LOG_INF("subtask %s: %s -> %s\n", subtask_id.c_str(),
            subtask_status_to_string(old_status), subtask_status_to_string(status));

    if (!dependents.empty()) {
        LOG_INF("resubmitting %zu dependents of %s\n", dependents.size(), subtask_id.c_str());
        assign_subtasks(dependents);
    }
    return true;
}

void task_decomposer::handle_assignment(const task_assignment& assignment) {
    sub_task updated;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->subtasks.find(assignment.assigned_task.task_id);
        if (it == pimpl->subtasks.end() || it->second.status != SUBTASK_STATUS_PENDING) {
            return;
        }
        it->second.status = SUBTASK_STATUS_IN_PROGRESS;
        it->second.assigned_agent = assignment.agent_id;
        updated = it->second;
    }

    pimpl->record_progress({updated});
}

std::vector<sub_task> task_decomposer::get_subtasks_for_task(const std::string& parent_task_id) const {
    std::vector<sub_task> result;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        for (const auto& [id, st] : pimpl->subtasks) {
            if (st.parent_task_id == parent_task_id) {
                result.push_back(st);
            }
        }
    }
    std::sort(result.begin(), result.end(),
              [](const sub_task& a, const sub_task& b) { return a.step_number < b.step_number; });
    return result;
}

std::optional<sub_task> task_decomposer::get_subtask(const std::string& subtask_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->subtasks.find(subtask_id);
    if (it == pimpl->subtasks.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace dispatch
