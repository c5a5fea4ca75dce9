#include "scheduler.h"
#include "log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <tuple>
#include <unordered_map>

using json = nlohmann::json;

namespace dispatch {

namespace {

struct backlog_entry {
    int priority;
    uint64_t seq;
    task queued_task;
};

// Min-heap on (priority, seq) for std::push_heap / std::pop_heap
struct backlog_compare {
    bool operator()(const backlog_entry& a, const backlog_entry& b) const {
        return std::tie(a.priority, a.seq) > std::tie(b.priority, b.seq);
    }
};

struct store_write {
    std::string owner_id;
    std::string kind;
    std::string content;
};

struct log_line {
    log_level level;
    std::string text;
};

// Side effects collected under the lock and applied after it is released
struct pending_effects {
    std::vector<store_write> writes;
    std::vector<task_assignment> assigned;
    std::vector<log_line> logs;

    void log(log_level level, std::string text) {
        logs.push_back({level, std::move(text)});
    }
};

double priority_weight(int priority) {
    return (6 - priority) / 5.0;
}

} // namespace

struct scheduler::impl {
    capability_registry& registry;
    scheduler_params params;
    memory_store_i* store;
    clock_fn clock;

    // agent_id -> task_id -> assignment
    std::map<std::string, std::map<std::string, task_assignment>> active_tasks;
    // task_id -> agent_id for active assignments
    std::unordered_map<std::string, std::string> task_agents;
    // task_id -> assignments in order, append-only
    std::map<std::string, std::vector<task_assignment>> task_history;
    // task_id -> terminal record
    std::map<std::string, task_assignment> failed_tasks;
    // agent_id -> last heartbeat (ms)
    std::map<std::string, int64_t> agent_health;

    // Heap of backlog entries. Entries whose seq no longer matches queued[task_id]
    // are stale and skipped when popped.
    std::vector<backlog_entry> backlog;
    std::unordered_map<std::string, uint64_t> queued;
    uint64_t next_seq = 0;

    assignment_callback on_assign;

    mutable std::mutex mutex;

    impl(capability_registry& registry, const scheduler_params& params,
         memory_store_i* store, clock_fn clock)
        : registry(registry), params(params), store(store), clock(std::move(clock)) {
        if (!this->clock) {
            this->clock = get_timestamp_ms;
        }
    }

    bool is_healthy_locked(const std::string& agent_id, int64_t now) const {
        auto it = agent_health.find(agent_id);
        if (it == agent_health.end()) {
            return false;
        }
        return now - it->second <= params.heartbeat_timeout_ms;
    }

    size_t active_count_locked(const std::string& agent_id) const {
        auto it = active_tasks.find(agent_id);
        return it == active_tasks.end() ? 0 : it->second.size();
    }

    double agent_load_locked(const std::string& agent_id) const {
        auto it = active_tasks.find(agent_id);
        if (it == active_tasks.end()) {
            return 0.0;
        }
        double weighted = 0.0;
        for (const auto& [task_id, assignment] : it->second) {
            weighted += priority_weight(assignment.assigned_task.priority);
        }
        return weighted / params.max_tasks_per_agent;
    }

    // Weighted mean strength over the required capabilities, earlier entries
    // weighing more. nullopt if the agent lacks any of them.
    static std::optional<double> capability_score(const std::map<capability, double>& strengths,
                                                  const std::vector<capability>& required) {
        const size_t n = required.size();
        double total_strength = 0.0;
        double total_weight = 0.0;
        for (size_t i = 0; i < n; i++) {
            auto it = strengths.find(required[i]);
            if (it == strengths.end()) {
                return std::nullopt;
            }
            const double weight = 1.0 + 0.2 * static_cast<double>(n - 1 - i);
            total_strength += it->second * weight;
            total_weight += weight;
        }
        return total_strength / total_weight;
    }

    std::vector<task_assignment>::iterator find_history_entry_locked(const task_assignment& a) {
        auto entries = task_history.find(a.assigned_task.task_id);
        if (entries != task_history.end()) {
            for (auto it = entries->second.rbegin(); it != entries->second.rend(); ++it) {
                if (it->agent_id == a.agent_id && it->assigned_at == a.assigned_at &&
                    !it->is_completed() && !it->is_failed()) {
                    return std::next(it).base();
                }
            }
        }
        LOG_ERR("no open history entry for task %s on agent %s\n",
                a.assigned_task.task_id.c_str(), a.agent_id.c_str());
        throw std::logic_error("assignment history out of sync for task " + a.assigned_task.task_id);
    }

    void remove_active_locked(const std::string& agent_id, const std::string& task_id) {
        auto it = active_tasks.find(agent_id);
        it->second.erase(task_id);
        if (it->second.empty()) {
            active_tasks.erase(it);
        }
        task_agents.erase(task_id);
    }

    bool enqueue_locked(const task& t, uint64_t seq, bool record, pending_effects& fx) {
        if (queued.count(t.task_id)) {
            return false;
        }
        backlog.push_back({t.priority, seq, t});
        std::push_heap(backlog.begin(), backlog.end(), backlog_compare());
        queued[t.task_id] = seq;

        if (!record) {
            return true;
        }
        json j;
        j["priority"] = t.priority;
        j["retry_count"] = t.retry_count;
        fx.writes.push_back({t.task_id, "task_queued", j.dump()});
        return true;
    }

    bool enqueue_locked(const task& t, pending_effects& fx) {
        return enqueue_locked(t, next_seq++, true, fx);
    }

    std::optional<backlog_entry> pop_backlog_locked() {
        while (!backlog.empty()) {
            std::pop_heap(backlog.begin(), backlog.end(), backlog_compare());
            backlog_entry entry = std::move(backlog.back());
            backlog.pop_back();

            auto it = queued.find(entry.queued_task.task_id);
            if (it == queued.end() || it->second != entry.seq) {
                continue;
            }
            queued.erase(it);
            return entry;
        }
        return std::nullopt;
    }

    // Pick and record the best agent. Does not validate, sweep or enqueue.
    std::optional<std::string> try_assign_locked(const task& t, int64_t now, pending_effects& fx) {
        double deadline_factor = 1.0;
        if (t.has_deadline()) {
            const double seconds_left = (t.deadline - now) / 1000.0;
            if (seconds_left <= 0.0) {
                return std::nullopt;
            }
            deadline_factor = std::min(params.max_deadline_factor,
                                       params.deadline_horizon_s / std::max(1.0, seconds_left));
        }
        const double priority_factor = priority_weight(t.priority);

        std::optional<std::string> best_agent;
        double best_score = 0.0;
        double best_capability = 0.0;

        // Matrix rows come in agent_id order; the strict comparison keeps the lowest id on ties
        const capability_matrix matrix = registry.get_capability_matrix();
        for (const auto& [agent_id, strengths] : matrix) {
            if (!is_healthy_locked(agent_id, now)) {
                continue;
            }
            if (active_count_locked(agent_id) >= static_cast<size_t>(params.max_tasks_per_agent)) {
                continue;
            }

            auto cap_score = capability_score(strengths, t.required_capabilities);
            if (!cap_score) {
                continue;
            }

            const double load_factor = 1.0 - agent_load_locked(agent_id);
            const double score =
                params.capability_weight * *cap_score +
                params.load_weight       * load_factor +
                params.priority_weight   * priority_factor +
                params.deadline_weight   * deadline_factor;

            LOG_DBG("task %s agent %s: capability %.3f load %.3f priority %.3f deadline %.3f -> %.3f\n",
                    t.task_id.c_str(), agent_id.c_str(), *cap_score, load_factor,
                    priority_factor, deadline_factor, score);

            if (!best_agent || score > best_score) {
                best_agent = agent_id;
                best_score = score;
                best_capability = *cap_score;
            }
        }

        if (!best_agent) {
            return std::nullopt;
        }

        task_assignment assignment;
        assignment.assigned_task = t;
        assignment.agent_id = *best_agent;
        assignment.assigned_at = now;
        assignment.capability_match_score = best_capability;
        assignment.score = best_score;

        active_tasks[*best_agent][t.task_id] = assignment;
        task_agents[t.task_id] = *best_agent;
        task_history[t.task_id].push_back(assignment);

        // A queued copy is superseded by this assignment
        queued.erase(t.task_id);

        json j;
        j["agent_id"] = *best_agent;
        j["score"] = best_score;
        j["capability_match_score"] = best_capability;
        j["retry_count"] = t.retry_count;
        fx.writes.push_back({t.task_id, "task_assigned", j.dump()});
        fx.assigned.push_back(assignment);

        char buf[256];
        snprintf(buf, sizeof(buf), "task %s assigned to agent %s with score %.3f\n",
                 t.task_id.c_str(), best_agent->c_str(), best_score);
        fx.log(LOG_LEVEL_INFO, buf);

        return best_agent;
    }

    bool handle_failure_locked(const std::string& agent_id, const std::string& task_id,
                               const std::string& reason, bool retry, int64_t now,
                               pending_effects& fx) {
        auto agent_it = active_tasks.find(agent_id);
        if (agent_it == active_tasks.end()) {
            return false;
        }
        auto task_it = agent_it->second.find(task_id);
        if (task_it == agent_it->second.end()) {
            return false;
        }

        auto history_it = find_history_entry_locked(task_it->second);

        task_assignment assignment = task_it->second;
        assignment.failed_at = now;
        assignment.failure_reason = reason;
        *history_it = assignment;

        remove_active_locked(agent_id, task_id);

        task t = assignment.assigned_task;
        json j;
        j["agent_id"] = agent_id;
        j["reason"] = reason;

        if (retry && t.retry_count < t.max_retries) {
            t.retry_count++;
            t.priority = std::max(TASK_PRIORITY_HIGHEST, t.priority - 1);
            enqueue_locked(t, fx);

            j["retry_count"] = t.retry_count;
            j["terminal"] = false;
            fx.log(LOG_LEVEL_WARN, "task " + task_id + " failed on agent " + agent_id + " (" + reason +
                   "), queued for retry " + std::to_string(t.retry_count) + "/" +
                   std::to_string(t.max_retries) + "\n");
        } else {
            failed_tasks[task_id] = assignment;

            j["retry_count"] = t.retry_count;
            j["terminal"] = true;
            fx.log(LOG_LEVEL_WARN, "task " + task_id + " permanently failed after " +
                   std::to_string(t.retry_count) + " retries (" + reason + ")\n");
        }
        fx.writes.push_back({task_id, "task_failed", j.dump()});
        return true;
    }

    size_t sweep_timeouts_locked(int64_t now, pending_effects& fx) {
        std::vector<std::pair<std::string, std::string>> expired;
        for (const auto& [agent_id, tasks] : active_tasks) {
            for (const auto& [task_id, assignment] : tasks) {
                if (now - assignment.assigned_at >= assignment.assigned_task.timeout_ms) {
                    expired.emplace_back(agent_id, task_id);
                }
            }
        }

        for (const auto& [agent_id, task_id] : expired) {
            handle_failure_locked(agent_id, task_id, "timed out", true, now, fx);
        }
        return expired.size();
    }

    // Assign from the head of the backlog until an entry cannot be placed.
    // That entry keeps its position; expired entries are failed permanently.
    size_t drain_backlog_locked(int64_t now, pending_effects& fx) {
        size_t assigned = 0;
        while (auto entry = pop_backlog_locked()) {
            const task& t = entry->queued_task;

            if (t.has_deadline() && t.deadline <= now) {
                task_assignment record;
                record.assigned_task = t;
                record.failed_at = now;
                record.failure_reason = "deadline exceeded";
                failed_tasks[t.task_id] = record;

                json j;
                j["reason"] = record.failure_reason;
                j["terminal"] = true;
                fx.writes.push_back({t.task_id, "task_failed", j.dump()});
                fx.log(LOG_LEVEL_WARN, "queued task " + t.task_id + " dropped, deadline exceeded\n");
                continue;
            }

            if (try_assign_locked(t, now, fx)) {
                assigned++;
                continue;
            }

            // Back to its original position
            enqueue_locked(t, entry->seq, false, fx);
            break;
        }
        return assigned;
    }

    void flush(pending_effects& fx) {
        for (const auto& line : fx.logs) {
            dispatch_log_write(line.level, "%s", line.text.c_str());
        }

        if (store) {
            for (const auto& w : fx.writes) {
                try {
                    store->store(w.owner_id, w.kind, w.content);
                } catch (const std::exception& e) {
                    LOG_ERR("failed to store %s record for task %s: %s\n",
                            w.kind.c_str(), w.owner_id.c_str(), e.what());
                }
            }
        }

        if (fx.assigned.empty()) {
            return;
        }

        assignment_callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            callback = on_assign;
        }
        if (!callback) {
            return;
        }
        for (const auto& a : fx.assigned) {
            try {
                callback(a);
            } catch (const std::exception& e) {
                LOG_ERR("assignment callback failed for task %s: %s\n",
                        a.assigned_task.task_id.c_str(), e.what());
            }
        }
    }
};

static void check_id(const std::string& id, const char* what) {
    if (is_blank(id)) {
        throw validation_error(std::string(what) + " must be a non-empty string");
    }
}

// Agent ids are keyed the way the registry stores them
static std::string checked_agent_id(const std::string& agent_id) {
    check_id(agent_id, "agent_id");
    return trim(agent_id);
}

scheduler::scheduler(capability_registry& registry, const scheduler_params& params,
                     memory_store_i* store, clock_fn clock) {
    validate_params(params);
    pimpl = std::make_unique<impl>(registry, params, store, std::move(clock));
    LOG_INF("scheduler initialized with max_tasks_per_agent=%d\n", params.max_tasks_per_agent);
}

scheduler::~scheduler() = default;

std::optional<std::string> scheduler::assign_task(const task& t) {
    t.validate();

    pending_effects fx;
    std::optional<std::string> agent_id;
    std::string rejection;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);

        // Expired assignments are released before the resubmission checks
        const int64_t now = pimpl->clock();
        pimpl->sweep_timeouts_locked(now, fx);

        auto active_it = pimpl->task_agents.find(t.task_id);
        if (active_it != pimpl->task_agents.end()) {
            rejection = "task " + t.task_id + " is already assigned to agent " + active_it->second;
        } else if (pimpl->failed_tasks.count(t.task_id)) {
            rejection = "task " + t.task_id + " has permanently failed";
        } else if (t.has_deadline() && t.deadline <= now) {
            fx.log(LOG_LEVEL_WARN, "task " + t.task_id + " is already past its deadline\n");
        } else {
            agent_id = pimpl->try_assign_locked(t, now, fx);
            if (!agent_id) {
                if (pimpl->enqueue_locked(t, fx)) {
                    fx.log(LOG_LEVEL_WARN, "no suitable agent for task " + t.task_id + ", queued\n");
                } else {
                    fx.log(LOG_LEVEL_INFO, "no suitable agent for task " + t.task_id + ", already queued\n");
                }
            }
        }
    }

    pimpl->flush(fx);
    if (!rejection.empty()) {
        throw validation_error(rejection);
    }
    return agent_id;
}

size_t scheduler::check_task_timeouts() {
    pending_effects fx;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        count = pimpl->sweep_timeouts_locked(pimpl->clock(), fx);
    }

    pimpl->flush(fx);
    if (count > 0) {
        LOG_INF("handled %zu timed out tasks\n", count);
    }
    return count;
}

bool scheduler::complete_task(const std::string& agent,
                              const std::string& task_id,
                              const std::optional<std::string>& result) {
    const std::string agent_id = checked_agent_id(agent);
    check_id(task_id, "task_id");

    pending_effects fx;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);

        auto agent_it = pimpl->active_tasks.find(agent_id);
        if (agent_it != pimpl->active_tasks.end() && agent_it->second.count(task_id)) {
            const int64_t now = pimpl->clock();
            auto& assignment = agent_it->second.at(task_id);
            auto history_it = pimpl->find_history_entry_locked(assignment);

            assignment.completed_at = now;
            if (result) {
                assignment.assigned_task.metadata["result"] = *result;
            }
            *history_it = assignment;

            pimpl->remove_active_locked(agent_id, task_id);

            json j;
            j["agent_id"] = agent_id;
            if (result) {
                j["result"] = *result;
            }
            fx.writes.push_back({task_id, "task_completed", j.dump()});
            fx.log(LOG_LEVEL_INFO, "task " + task_id + " completed by agent " + agent_id + "\n");

            const size_t drained = pimpl->drain_backlog_locked(now, fx);
            if (drained > 0) {
                fx.log(LOG_LEVEL_INFO, "assigned " + std::to_string(drained) + " queued tasks\n");
            }
            found = true;
        } else {
            fx.log(LOG_LEVEL_WARN, "task " + task_id + " not active on agent " + agent_id + "\n");
        }
    }

    pimpl->flush(fx);
    return found;
}

bool scheduler::fail_task(const std::string& agent,
                          const std::string& task_id,
                          const std::string& reason,
                          bool retry) {
    const std::string agent_id = checked_agent_id(agent);
    check_id(task_id, "task_id");

    pending_effects fx;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        found = pimpl->handle_failure_locked(agent_id, task_id, reason, retry, pimpl->clock(), fx);
        if (!found) {
            fx.log(LOG_LEVEL_WARN, "task " + task_id + " not active on agent " + agent_id + "\n");
        }
    }

    pimpl->flush(fx);
    return found;
}

size_t scheduler::retry_failed_tasks() {
    pending_effects fx;
    size_t resubmitted = 0;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        const int64_t now = pimpl->clock();
        pimpl->sweep_timeouts_locked(now, fx);

        std::vector<task> retryable;
        for (auto it = pimpl->failed_tasks.begin(); it != pimpl->failed_tasks.end();) {
            const task& t = it->second.assigned_task;
            if (t.has_deadline() && t.deadline <= now) {
                // Past its deadline, stays failed
                ++it;
            } else if (t.retry_count < t.max_retries) {
                retryable.push_back(t);
                it = pimpl->failed_tasks.erase(it);
            } else {
                ++it;
            }
        }

        for (const auto& t : retryable) {
            if (!pimpl->try_assign_locked(t, now, fx)) {
                pimpl->enqueue_locked(t, fx);
            }
            resubmitted++;
        }
    }

    pimpl->flush(fx);
    LOG_INF("attempted to retry %zu failed tasks\n", resubmitted);
    return resubmitted;
}

size_t scheduler::process_backlog() {
    pending_effects fx;
    size_t assigned = 0;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        assigned = pimpl->drain_backlog_locked(pimpl->clock(), fx);
    }

    pimpl->flush(fx);
    if (assigned > 0) {
        LOG_INF("assigned %zu queued tasks\n", assigned);
    }
    return assigned;
}

void scheduler::update_agent_health(const std::string& agent) {
    const std::string agent_id = checked_agent_id(agent);

    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->agent_health[agent_id] = pimpl->clock();
}

bool scheduler::is_agent_healthy(const std::string& agent) const {
    if (is_blank(agent)) {
        return false;
    }
    const std::string agent_id = trim(agent);

    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->is_healthy_locked(agent_id, pimpl->clock());
}

std::vector<task> scheduler::get_agent_tasks(const std::string& agent) const {
    const std::string agent_id = checked_agent_id(agent);

    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<task> tasks;
    auto it = pimpl->active_tasks.find(agent_id);
    if (it != pimpl->active_tasks.end()) {
        for (const auto& [task_id, assignment] : it->second) {
            tasks.push_back(assignment.assigned_task);
        }
    }
    return tasks;
}

std::optional<std::string> scheduler::get_task_agent(const std::string& task_id) const {
    check_id(task_id, "task_id");

    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->task_agents.find(task_id);
    if (it == pimpl->task_agents.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<task_assignment> scheduler::get_task_history(const std::string& task_id) const {
    check_id(task_id, "task_id");

    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->task_history.find(task_id);
    if (it == pimpl->task_history.end()) {
        return {};
    }
    return it->second;
}

std::vector<task> scheduler::get_queued_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<const backlog_entry*> live;
    for (const auto& entry : pimpl->backlog) {
        auto it = pimpl->queued.find(entry.queued_task.task_id);
        if (it != pimpl->queued.end() && it->second == entry.seq) {
            live.push_back(&entry);
        }
    }
    std::sort(live.begin(), live.end(), [](const backlog_entry* a, const backlog_entry* b) {
        return std::tie(a->priority, a->seq) < std::tie(b->priority, b->seq);
    });

    std::vector<task> tasks;
    tasks.reserve(live.size());
    for (const auto* entry : live) {
        tasks.push_back(entry->queued_task);
    }
    return tasks;
}

std::map<std::string, task_assignment> scheduler::get_failed_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->failed_tasks;
}

size_t scheduler::get_active_count() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->task_agents.size();
}

std::string scheduler::get_stats() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    const int64_t now = pimpl->clock();

    json agents = json::object();
    for (const auto& [agent_id, heartbeat] : pimpl->agent_health) {
        agents[agent_id] = {
            {"active", pimpl->active_count_locked(agent_id)},
            {"load", pimpl->agent_load_locked(agent_id)},
            {"healthy", pimpl->is_healthy_locked(agent_id, now)},
            {"last_heartbeat", heartbeat}
        };
    }

    json j;
    j["active_tasks"] = pimpl->task_agents.size();
    j["queued_tasks"] = pimpl->queued.size();
    j["failed_tasks"] = pimpl->failed_tasks.size();
    j["tracked_tasks"] = pimpl->task_history.size();
    j["agents"] = agents;
    return j.dump();
}

void scheduler::set_assignment_callback(assignment_callback callback) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->on_assign = std::move(callback);
}

const scheduler_params& scheduler::get_params() const {
    return pimpl->params;
}

} // namespace dispatch
