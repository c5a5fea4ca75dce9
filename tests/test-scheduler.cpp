// Test suite for the capability-aware task scheduler

#include "../common/dispatch/capability.h"
#include "../common/dispatch/log.h"
#include "../common/dispatch/maintenance.h"
#include "../common/dispatch/memory_store.h"
#include "../common/dispatch/params.h"
#include "../common/dispatch/scheduler.h"
#include "../common/dispatch/task.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dispatch;
using json = nlohmann::json;

// Test helpers
#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << msg << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
        return false; \
    } \
} while(0)

#define RUN_TEST(test_func) do { \
    std::cout << "Running " << #test_func << "..." << std::endl; \
    if (test_func()) { \
        std::cout << "  PASS" << std::endl; \
        passed++; \
    } else { \
        std::cout << "  FAIL" << std::endl; \
        failed++; \
    } \
    total++; \
} while(0)

// Manually advanced clock shared between the test and the scheduler
struct fake_clock {
    std::shared_ptr<std::atomic<int64_t>> now = std::make_shared<std::atomic<int64_t>>(1700000000000LL);

    clock_fn fn() const {
        auto n = now;
        return [n]() { return n->load(); };
    }

    int64_t get() const { return now->load(); }
    void advance(int64_t ms) { *now += ms; }
};

static task make_task(const std::string& id, std::vector<capability> caps, int priority = 3) {
    task t;
    t.task_id = id;
    t.required_capabilities = std::move(caps);
    t.priority = priority;
    return t;
}

static void add_agent(capability_registry& registry, scheduler& sched,
                      const std::string& id, std::vector<agent_capability> caps) {
    registry.register_agent(id, caps);
    sched.update_agent_health(id);
}

static scheduler_params params_with_capacity(int max_tasks) {
    scheduler_params params = scheduler_default_params();
    params.max_tasks_per_agent = max_tasks;
    return params;
}

// Test 1: Strongest agent wins
static bool test_assign_best_agent() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_CODE_GENERATION, 0.9)});
    add_agent(registry, sched, "A2", {agent_capability(CAPABILITY_CODE_GENERATION, 0.4)});

    auto agent = sched.assign_task(make_task("T1", {CAPABILITY_CODE_GENERATION}, 1));
    TEST_ASSERT(agent.has_value(), "Task should be assigned");
    TEST_ASSERT(*agent == "A1", "Stronger agent should win");
    TEST_ASSERT(sched.get_task_agent("T1") == std::optional<std::string>("A1"), "Task should map to A1");

    auto tasks = sched.get_agent_tasks("A1");
    TEST_ASSERT(tasks.size() == 1 && tasks[0].task_id == "T1", "A1 should hold T1");
    TEST_ASSERT(sched.get_agent_tasks("A2").empty(), "A2 should hold nothing");

    auto history = sched.get_task_history("T1");
    TEST_ASSERT(history.size() == 1, "One history entry expected");
    TEST_ASSERT(history[0].agent_id == "A1", "History should name A1");
    TEST_ASSERT(history[0].capability_match_score > 0.899 && history[0].capability_match_score < 0.901,
                "Capability score should be the agent strength");

    return true;
}

// Test 2: Weighted capability score favors earlier capabilities
static bool test_capability_order_weighting() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    // Weights for two capabilities are 1.2 and 1.0
    add_agent(registry, sched, "strong-first", {
        agent_capability(CAPABILITY_CODE_GENERATION, 0.9),
        agent_capability(CAPABILITY_CODE_REVIEW, 0.5)
    });
    add_agent(registry, sched, "strong-second", {
        agent_capability(CAPABILITY_CODE_GENERATION, 0.5),
        agent_capability(CAPABILITY_CODE_REVIEW, 0.9)
    });

    auto agent = sched.assign_task(make_task("T1", {CAPABILITY_CODE_GENERATION, CAPABILITY_CODE_REVIEW}));
    TEST_ASSERT(agent == std::optional<std::string>("strong-first"), "Earlier capability should weigh more");

    auto history = sched.get_task_history("T1");
    const double expected = (0.9 * 1.2 + 0.5 * 1.0) / 2.2;
    TEST_ASSERT(history[0].capability_match_score > expected - 1e-9 &&
                history[0].capability_match_score < expected + 1e-9, "Weighted mean mismatch");

    return true;
}

// Test 3: Ties go to the lowest agent id
static bool test_tie_break_lowest_id() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "agent-b", {agent_capability(CAPABILITY_RESEARCH, 0.7)});
    add_agent(registry, sched, "agent-a", {agent_capability(CAPABILITY_RESEARCH, 0.7)});

    auto agent = sched.assign_task(make_task("T1", {CAPABILITY_RESEARCH}));
    TEST_ASSERT(agent == std::optional<std::string>("agent-a"), "Lowest id should win a tie");

    // agent-a now carries load, so agent-b wins the next one
    agent = sched.assign_task(make_task("T2", {CAPABILITY_RESEARCH}));
    TEST_ASSERT(agent == std::optional<std::string>("agent-b"), "Less loaded agent should win");

    return true;
}

// Test 4: Agents missing a required capability are excluded
static bool test_missing_capability_excluded() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "coder", {agent_capability(CAPABILITY_CODE_GENERATION, 1.0)});
    add_agent(registry, sched, "full", {
        agent_capability(CAPABILITY_CODE_GENERATION, 0.3),
        agent_capability(CAPABILITY_CODE_REVIEW, 0.3)
    });

    auto agent = sched.assign_task(make_task("T1", {CAPABILITY_CODE_GENERATION, CAPABILITY_CODE_REVIEW}));
    TEST_ASSERT(agent == std::optional<std::string>("full"), "Only the agent with every capability qualifies");

    agent = sched.assign_task(make_task("T2", {CAPABILITY_LEGAL_ANALYSIS}));
    TEST_ASSERT(!agent.has_value(), "Nobody holds legal_analysis");
    auto queued = sched.get_queued_tasks();
    TEST_ASSERT(queued.size() == 1 && queued[0].task_id == "T2", "Unassignable task should be queued");

    return true;
}

// Test 5: Heartbeat window
static bool test_unhealthy_agent_excluded() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "stale", {agent_capability(CAPABILITY_SUMMARIZATION, 1.0)});
    registry.register_agent("silent", {agent_capability(CAPABILITY_SUMMARIZATION, 1.0)});

    TEST_ASSERT(sched.is_agent_healthy("stale"), "Fresh heartbeat should be healthy");
    TEST_ASSERT(!sched.is_agent_healthy("silent"), "Agent without heartbeat is unhealthy");

    clock.advance(5 * 60 * 1000);
    TEST_ASSERT(sched.is_agent_healthy("stale"), "Exactly at the window edge is still healthy");

    clock.advance(1);
    TEST_ASSERT(!sched.is_agent_healthy("stale"), "Heartbeat older than 5 minutes is unhealthy");

    auto agent = sched.assign_task(make_task("T1", {CAPABILITY_SUMMARIZATION}));
    TEST_ASSERT(!agent.has_value(), "No healthy agent should be chosen");

    sched.update_agent_health("silent");
    TEST_ASSERT(sched.process_backlog() == 1, "Backlog should drain once an agent reports in");
    TEST_ASSERT(sched.get_task_agent("T1") == std::optional<std::string>("silent"), "Task should go to silent");

    return true;
}

// Test 6: Capacity limit and backlog drain on completion
static bool test_capacity_and_backlog_drain() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, params_with_capacity(2), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_TRANSLATION, 0.8)});

    TEST_ASSERT(sched.assign_task(make_task("T1", {CAPABILITY_TRANSLATION})).has_value(), "T1 assigned");
    TEST_ASSERT(sched.assign_task(make_task("T2", {CAPABILITY_TRANSLATION})).has_value(), "T2 assigned");
    TEST_ASSERT(!sched.assign_task(make_task("T3", {CAPABILITY_TRANSLATION})).has_value(), "T3 over capacity");
    TEST_ASSERT(sched.get_agent_tasks("A1").size() == 2, "Agent should hold two tasks");
    TEST_ASSERT(sched.get_queued_tasks().size() == 1, "T3 should be queued");

    TEST_ASSERT(sched.complete_task("A1", "T1", std::string("done")), "Completion should succeed");
    TEST_ASSERT(sched.get_task_agent("T3") == std::optional<std::string>("A1"), "T3 drained on completion");
    TEST_ASSERT(sched.get_queued_tasks().empty(), "Backlog should be empty");

    auto history = sched.get_task_history("T1");
    TEST_ASSERT(history.size() == 1 && history[0].is_completed(), "Completion stamped in history");
    TEST_ASSERT(history[0].assigned_task.metadata.at("result") == "done", "Result kept in metadata");

    TEST_ASSERT(!sched.complete_task("A1", "T1"), "Completing twice should fail");
    TEST_ASSERT(!sched.complete_task("A2", "T2"), "Wrong agent should fail");

    return true;
}

// Test 7: Backlog order is priority then arrival
static bool test_backlog_priority_fifo() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, params_with_capacity(1), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_FACT_CHECKING, 0.5)});

    TEST_ASSERT(sched.assign_task(make_task("busy", {CAPABILITY_FACT_CHECKING})).has_value(), "First assigned");
    sched.assign_task(make_task("first", {CAPABILITY_FACT_CHECKING}, 3));
    sched.assign_task(make_task("second", {CAPABILITY_FACT_CHECKING}, 3));
    sched.assign_task(make_task("urgent", {CAPABILITY_FACT_CHECKING}, 2));

    auto queued = sched.get_queued_tasks();
    TEST_ASSERT(queued.size() == 3, "Three queued tasks");
    TEST_ASSERT(queued[0].task_id == "urgent", "Higher priority first");
    TEST_ASSERT(queued[1].task_id == "first", "Then arrival order");
    TEST_ASSERT(queued[2].task_id == "second", "Then arrival order");

    sched.complete_task("A1", "busy");
    TEST_ASSERT(sched.get_task_agent("urgent").has_value(), "Urgent drained first");
    TEST_ASSERT(sched.get_queued_tasks().size() == 2, "Drain stops at capacity");

    sched.complete_task("A1", "urgent");
    TEST_ASSERT(sched.get_task_agent("first").has_value(), "FIFO among equal priority");
    TEST_ASSERT(!sched.get_task_agent("second").has_value(), "Second still waiting");

    // Resubmitting a queued task does not queue it twice
    TEST_ASSERT(!sched.assign_task(make_task("second", {CAPABILITY_FACT_CHECKING}, 3)).has_value(),
                "Still no capacity");
    TEST_ASSERT(sched.get_queued_tasks().size() == 1, "Task must not be queued twice");

    return true;
}

// Test 8: Timed out assignment is requeued with raised priority
static bool test_timeout_requeues() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_CODE_GENERATION, 0.9)});

    task t = make_task("T1", {CAPABILITY_CODE_GENERATION}, 1);
    t.timeout_ms = 0;
    TEST_ASSERT(sched.assign_task(t) == std::optional<std::string>("A1"), "Task assigned");

    TEST_ASSERT(sched.check_task_timeouts() == 1, "One assignment timed out");
    TEST_ASSERT(!sched.get_task_agent("T1").has_value(), "Assignment removed");
    TEST_ASSERT(sched.get_agent_tasks("A1").empty(), "Agent freed");

    auto queued = sched.get_queued_tasks();
    TEST_ASSERT(queued.size() == 1, "Task should be back in the backlog");
    TEST_ASSERT(queued[0].retry_count == 1, "retry_count incremented");
    TEST_ASSERT(queued[0].priority == 1, "Priority floored at 1");

    auto history = sched.get_task_history("T1");
    TEST_ASSERT(history.size() == 1, "History keeps the attempt");
    TEST_ASSERT(history[0].is_failed() && history[0].failure_reason == "timed out", "Attempt marked timed out");

    return true;
}

// Test 9: Longer timeouts only fire once elapsed
static bool test_timeout_not_elapsed() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_DATA_ANALYSIS, 0.6)});

    task t = make_task("T1", {CAPABILITY_DATA_ANALYSIS}, 4);
    t.timeout_ms = 10000;
    sched.assign_task(t);

    clock.advance(9999);
    TEST_ASSERT(sched.check_task_timeouts() == 0, "Not yet timed out");

    clock.advance(1);
    TEST_ASSERT(sched.check_task_timeouts() == 1, "Timed out at the limit");
    TEST_ASSERT(sched.get_queued_tasks()[0].priority == 3, "Priority raised by one level");

    return true;
}

// Test 10: Retries are exhausted into permanent failure
static bool test_retries_exhausted() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_MATH_REASONING, 0.7)});

    task t = make_task("T1", {CAPABILITY_MATH_REASONING});
    t.max_retries = 1;
    sched.assign_task(t);

    TEST_ASSERT(sched.fail_task("A1", "T1", "crashed"), "First failure");
    TEST_ASSERT(sched.get_queued_tasks().size() == 1, "Retry queued");
    TEST_ASSERT(sched.process_backlog() == 1, "Retry reassigned");

    TEST_ASSERT(sched.fail_task("A1", "T1", "crashed again"), "Second failure");
    TEST_ASSERT(sched.get_queued_tasks().empty(), "No retry left");

    auto failed_tasks = sched.get_failed_tasks();
    TEST_ASSERT(failed_tasks.count("T1") == 1, "Task permanently failed");
    TEST_ASSERT(failed_tasks.at("T1").failure_reason == "crashed again", "Last reason kept");
    TEST_ASSERT(sched.retry_failed_tasks() == 0, "Exhausted task is not retried");

    auto history = sched.get_task_history("T1");
    TEST_ASSERT(history.size() == 2, "Two attempts recorded");
    TEST_ASSERT(history[0].is_failed() && history[1].is_failed(), "Both attempts failed");

    bool threw = false;
    try {
        sched.assign_task(t);
    } catch (const validation_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Permanently failed task cannot be resubmitted");

    return true;
}

// Test 11: Failures without retry can be resubmitted later
static bool test_retry_failed_tasks() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_TASK_PLANNING, 0.7)});

    sched.assign_task(make_task("T1", {CAPABILITY_TASK_PLANNING}));
    TEST_ASSERT(sched.fail_task("A1", "T1", "aborted", false), "Failure without retry");
    TEST_ASSERT(sched.get_failed_tasks().size() == 1, "Task failed permanently");

    TEST_ASSERT(sched.retry_failed_tasks() == 1, "Task with retries left is resubmitted");
    TEST_ASSERT(sched.get_failed_tasks().empty(), "Failed set cleared");
    TEST_ASSERT(sched.get_task_agent("T1") == std::optional<std::string>("A1"), "Task reassigned");

    TEST_ASSERT(!sched.fail_task("A1", "missing", "nope"), "Unknown task cannot fail");

    return true;
}

// Test 12: Malformed input is rejected before any state change
static bool test_validation_errors() {
    fake_clock clock;
    capability_registry registry;
    in_memory_store store;
    scheduler sched(registry, scheduler_default_params(), &store, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_RESEARCH, 0.5)});

    std::vector<task> bad;
    bad.push_back(make_task("", {CAPABILITY_RESEARCH}));
    bad.push_back(make_task("T1", {}));
    bad.push_back(make_task("T2", {CAPABILITY_RESEARCH}, 0));
    bad.push_back(make_task("T3", {CAPABILITY_RESEARCH}, 6));
    bad.push_back(make_task("T4", {CAPABILITY_RESEARCH, CAPABILITY_RESEARCH}));
    bad.push_back(make_task("T5", {static_cast<capability>(99)}));
    task negative_timeout = make_task("T6", {CAPABILITY_RESEARCH});
    negative_timeout.timeout_ms = -1;
    bad.push_back(negative_timeout);

    for (const auto& t : bad) {
        bool threw = false;
        try {
            sched.assign_task(t);
        } catch (const validation_error&) {
            threw = true;
        }
        TEST_ASSERT(threw, "Malformed task should be rejected: " << t.task_id);
    }

    TEST_ASSERT(sched.get_active_count() == 0, "Nothing assigned");
    TEST_ASSERT(sched.get_queued_tasks().empty(), "Nothing queued");
    TEST_ASSERT(store.size() == 0, "Nothing stored");

    sched.assign_task(make_task("T7", {CAPABILITY_RESEARCH}));
    bool threw = false;
    try {
        sched.assign_task(make_task("T7", {CAPABILITY_RESEARCH}));
    } catch (const validation_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Active task cannot be assigned twice");
    TEST_ASSERT(sched.get_active_count() == 1, "Still one assignment");

    threw = false;
    try {
        sched.complete_task("  ", "T7");
    } catch (const validation_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Blank agent id rejected");

    return true;
}

// Test 13: Deadlines
static bool test_deadlines() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, params_with_capacity(1), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_LEGAL_ANALYSIS, 0.8)});

    task late = make_task("late", {CAPABILITY_LEGAL_ANALYSIS});
    late.deadline = clock.get() - 1;
    TEST_ASSERT(!sched.assign_task(late).has_value(), "Past deadline not assigned");
    TEST_ASSERT(sched.get_queued_tasks().empty(), "Past deadline not queued");

    sched.assign_task(make_task("busy", {CAPABILITY_LEGAL_ANALYSIS}));

    task soon = make_task("soon", {CAPABILITY_LEGAL_ANALYSIS});
    soon.deadline = clock.get() + 1000;
    TEST_ASSERT(!sched.assign_task(soon).has_value(), "No capacity");
    TEST_ASSERT(sched.get_queued_tasks().size() == 1, "Task with future deadline queued");

    clock.advance(2000);
    sched.complete_task("A1", "busy");
    TEST_ASSERT(!sched.get_task_agent("soon").has_value(), "Expired queued task not assigned");

    auto failed_tasks = sched.get_failed_tasks();
    TEST_ASSERT(failed_tasks.count("soon") == 1, "Expired queued task failed");
    TEST_ASSERT(failed_tasks.at("soon").failure_reason == "deadline exceeded", "Failure reason");

    return true;
}

// Test 14: Store records and assignment callback
static bool test_store_and_callback() {
    fake_clock clock;
    capability_registry registry;
    in_memory_store store;
    scheduler sched(registry, scheduler_default_params(), &store, clock.fn());

    std::vector<std::string> notified;
    sched.set_assignment_callback([&](const task_assignment& a) {
        notified.push_back(a.assigned_task.task_id);
    });

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_CODE_REVIEW, 0.8)});

    sched.assign_task(make_task("T1", {CAPABILITY_CODE_REVIEW}));
    sched.assign_task(make_task("T2", {CAPABILITY_FINANCIAL_ANALYSIS}));
    sched.complete_task("A1", "T1", std::string("ok"));

    TEST_ASSERT(notified.size() == 1 && notified[0] == "T1", "Callback fired once for T1");

    auto assigned = store.get_records("T1", "task_assigned");
    TEST_ASSERT(assigned.size() == 1, "Assignment recorded");
    json j = json::parse(assigned[0].content);
    TEST_ASSERT(j["agent_id"] == "A1", "Record names the agent");

    TEST_ASSERT(store.get_records("T1", "task_completed").size() == 1, "Completion recorded");
    TEST_ASSERT(store.get_records("T2", "task_queued").size() == 1, "Queueing recorded");

    // A throwing callback is logged, not propagated
    sched.set_assignment_callback([](const task_assignment&) {
        throw std::runtime_error("callback exploded");
    });
    auto agent = sched.assign_task(make_task("T3", {CAPABILITY_CODE_REVIEW}));
    TEST_ASSERT(agent.has_value(), "Assignment survives a throwing callback");

    return true;
}

// A store that always fails
class failing_store : public memory_store_i {
public:
    std::string store(const std::string&, const std::string&, const std::string&) override {
        throw std::runtime_error("disk full");
    }
};

// Test 15: Store failures never unwind scheduler state
static bool test_store_failure_logged() {
    fake_clock clock;
    capability_registry registry;
    failing_store store;
    scheduler sched(registry, scheduler_default_params(), &store, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_CODE_DOCUMENTATION, 0.8)});

    auto agent = sched.assign_task(make_task("T1", {CAPABILITY_CODE_DOCUMENTATION}));
    TEST_ASSERT(agent.has_value(), "Assignment succeeds despite store failure");
    TEST_ASSERT(sched.complete_task("A1", "T1"), "Completion succeeds despite store failure");

    return true;
}

// Test 16: Stats summary
static bool test_stats() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, params_with_capacity(2), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_DATA_VISUALIZATION, 0.8)});
    sched.assign_task(make_task("T1", {CAPABILITY_DATA_VISUALIZATION}, 1));
    sched.assign_task(make_task("T2", {CAPABILITY_SCIENTIFIC_REASONING}));

    json stats = json::parse(sched.get_stats());
    TEST_ASSERT(stats["active_tasks"] == 1, "One active");
    TEST_ASSERT(stats["queued_tasks"] == 1, "One queued");
    TEST_ASSERT(stats["failed_tasks"] == 0, "None failed");
    TEST_ASSERT(stats["agents"]["A1"]["active"] == 1, "Agent active count");
    TEST_ASSERT(stats["agents"]["A1"]["load"].get<double>() == 0.5, "Priority 1 task is half of capacity 2");
    TEST_ASSERT(stats["agents"]["A1"]["healthy"] == true, "Agent healthy");

    return true;
}

// Test 17: Invalid scheduler params are rejected at construction
static bool test_invalid_params() {
    capability_registry registry;
    scheduler_params params = scheduler_default_params();
    params.max_tasks_per_agent = 0;

    bool threw = false;
    try {
        scheduler sched(registry, params);
    } catch (const validation_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Zero capacity rejected");

    return true;
}

// Test 18: Concurrent submissions keep capacity and bookkeeping consistent
static bool test_concurrent_assignment() {
    capability_registry registry;
    scheduler sched(registry, params_with_capacity(3));

    const int num_agents = 4;
    for (int i = 0; i < num_agents; i++) {
        add_agent(registry, sched, "agent-" + std::to_string(i),
                  {agent_capability(CAPABILITY_SUMMARIZATION, 0.5 + 0.1 * i)});
    }

    const int num_threads = 4;
    const int tasks_per_thread = 10;
    std::atomic<int> assigned(0);
    std::atomic<int> errors(0);

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < tasks_per_thread; j++) {
                try {
                    auto agent = sched.assign_task(make_task(
                        "T" + std::to_string(i) + "-" + std::to_string(j), {CAPABILITY_SUMMARIZATION}));
                    if (agent) {
                        assigned++;
                    }
                } catch (const std::exception&) {
                    errors++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    TEST_ASSERT(errors.load() == 0, "No submission should throw");
    TEST_ASSERT(assigned.load() == num_agents * 3, "Every slot should be filled");
    TEST_ASSERT(sched.get_active_count() == static_cast<size_t>(num_agents * 3), "Active count matches");
    TEST_ASSERT(sched.get_queued_tasks().size() == static_cast<size_t>(num_threads * tasks_per_thread - num_agents * 3),
                "The rest should be queued");
    for (int i = 0; i < num_agents; i++) {
        TEST_ASSERT(sched.get_agent_tasks("agent-" + std::to_string(i)).size() == 3, "Agent at capacity");
    }

    return true;
}

// Test 19: Maintenance pass sweeps timeouts then drains the backlog
static bool test_maintenance_run_once() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, params_with_capacity(1), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_RESOURCE_MANAGEMENT, 0.6)});

    task slow = make_task("slow", {CAPABILITY_RESOURCE_MANAGEMENT});
    slow.timeout_ms = 1000;
    sched.assign_task(slow);
    sched.assign_task(make_task("waiting", {CAPABILITY_RESOURCE_MANAGEMENT}, 1));

    maintenance_loop loop(sched, 50);
    loop.run_once();
    TEST_ASSERT(sched.get_task_agent("slow").has_value(), "Nothing expired yet");
    TEST_ASSERT(loop.get_iterations() == 1, "One pass counted");

    clock.advance(1000);
    loop.run_once();
    TEST_ASSERT(sched.get_task_agent("waiting") == std::optional<std::string>("A1"), "Freed slot filled from backlog");
    auto queued = sched.get_queued_tasks();
    TEST_ASSERT(queued.size() == 1 && queued[0].task_id == "slow", "Timed out task waits for a retry");

    return true;
}

// Test 20: Background loop start and stop
static bool test_maintenance_thread() {
    capability_registry registry;
    scheduler sched(registry);

    bool threw = false;
    try {
        maintenance_loop bad(sched, 0);
    } catch (const validation_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Zero interval rejected");

    maintenance_loop loop(sched, 10);
    TEST_ASSERT(!loop.is_running(), "Not running before start");

    loop.start();
    TEST_ASSERT(loop.is_running(), "Running after start");
    loop.start();

    for (int i = 0; i < 200 && loop.get_iterations() < 3; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    TEST_ASSERT(loop.get_iterations() >= 3, "Loop keeps running passes");

    loop.stop();
    TEST_ASSERT(!loop.is_running(), "Stopped");
    const uint64_t after_stop = loop.get_iterations();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    TEST_ASSERT(loop.get_iterations() == after_stop, "No passes after stop");

    return true;
}

// Test 21: Failed tasks past their deadline are not retried
static bool test_retry_skips_expired_deadline() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_TASK_PLANNING, 0.7)});

    task t = make_task("T1", {CAPABILITY_TASK_PLANNING});
    t.deadline = clock.get() + 1000;
    TEST_ASSERT(sched.assign_task(t) == std::optional<std::string>("A1"), "Task assigned");
    TEST_ASSERT(sched.fail_task("A1", "T1", "aborted", false), "Failure without retry");

    clock.advance(1000);
    TEST_ASSERT(sched.retry_failed_tasks() == 0, "Expired task is not resubmitted");
    TEST_ASSERT(sched.get_queued_tasks().empty(), "Nothing queued");
    TEST_ASSERT(!sched.get_task_agent("T1").has_value(), "Nothing assigned");
    TEST_ASSERT(sched.get_failed_tasks().count("T1") == 1, "Task stays failed");
    TEST_ASSERT(sched.retry_failed_tasks() == 0, "Still skipped on the next pass");

    return true;
}

// Test 22: Resubmitting a task whose assignment expired reassigns it
static bool test_resubmit_after_expired_assignment() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    add_agent(registry, sched, "A1", {agent_capability(CAPABILITY_CODE_GENERATION, 0.9)});

    task t = make_task("T1", {CAPABILITY_CODE_GENERATION});
    t.timeout_ms = 1000;
    TEST_ASSERT(sched.assign_task(t) == std::optional<std::string>("A1"), "Task assigned");

    bool threw = false;
    try {
        sched.assign_task(t);
    } catch (const validation_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Live assignment cannot be resubmitted");

    clock.advance(1000);
    threw = false;
    std::optional<std::string> agent;
    try {
        agent = sched.assign_task(t);
    } catch (const validation_error&) {
        threw = true;
    }
    TEST_ASSERT(!threw, "Expired assignment released before the checks");
    TEST_ASSERT(agent == std::optional<std::string>("A1"), "Task reassigned");
    TEST_ASSERT(sched.get_queued_tasks().empty(), "Requeued copy removed from the backlog");
    TEST_ASSERT(sched.get_active_count() == 1, "One live assignment");

    auto history = sched.get_task_history("T1");
    TEST_ASSERT(history.size() == 2, "Two attempts recorded");
    TEST_ASSERT(history[0].failure_reason == "timed out", "First attempt timed out");

    return true;
}

// Test 23: Agent ids are trimmed on every lookup
static bool test_agent_ids_trimmed() {
    fake_clock clock;
    capability_registry registry;
    scheduler sched(registry, scheduler_default_params(), nullptr, clock.fn());

    registry.register_agent("A1", {agent_capability(CAPABILITY_RESEARCH, 0.8)});
    sched.update_agent_health(" A1 ");

    TEST_ASSERT(sched.is_agent_healthy("A1"), "Heartbeat stored under the trimmed id");
    TEST_ASSERT(sched.is_agent_healthy("A1 "), "Padded id finds the same agent");
    TEST_ASSERT(!sched.is_agent_healthy("   "), "Blank id is never healthy");

    TEST_ASSERT(sched.assign_task(make_task("T1", {CAPABILITY_RESEARCH})) == std::optional<std::string>("A1"),
                "Task assigned");
    TEST_ASSERT(sched.get_agent_tasks(" A1").size() == 1, "Padded id lists the agent's tasks");
    TEST_ASSERT(sched.complete_task("\tA1 ", "T1"), "Padded id completes the task");
    TEST_ASSERT(sched.get_agent_tasks("A1").empty(), "Agent freed");

    sched.assign_task(make_task("T2", {CAPABILITY_RESEARCH}));
    TEST_ASSERT(sched.fail_task(" A1", "T2", "crashed", false), "Padded id fails the task");
    TEST_ASSERT(sched.get_failed_tasks().count("T2") == 1, "Failure recorded");

    return true;
}

// Test 24: Concurrent start calls launch a single worker
static bool test_maintenance_concurrent_start() {
    capability_registry registry;
    scheduler sched(registry);
    maintenance_loop loop(sched, 10);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&loop]() { loop.start(); });
    }
    for (auto& th : threads) {
        th.join();
    }
    TEST_ASSERT(loop.is_running(), "Running after concurrent starts");

    loop.stop();
    TEST_ASSERT(!loop.is_running(), "Stopped");

    loop.start();
    TEST_ASSERT(loop.is_running(), "Restartable after stop");
    loop.stop();

    return true;
}

int main() {
    std::cout << "=== Task Scheduler Tests ===" << std::endl << std::endl;

    dispatch_log_set_level(LOG_LEVEL_ERROR);

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Scoring tests
    RUN_TEST(test_assign_best_agent);
    RUN_TEST(test_capability_order_weighting);
    RUN_TEST(test_tie_break_lowest_id);
    RUN_TEST(test_missing_capability_excluded);
    RUN_TEST(test_unhealthy_agent_excluded);

    // Backlog tests
    RUN_TEST(test_capacity_and_backlog_drain);
    RUN_TEST(test_backlog_priority_fifo);
    RUN_TEST(test_deadlines);

    // Failure handling tests
    RUN_TEST(test_timeout_requeues);
    RUN_TEST(test_timeout_not_elapsed);
    RUN_TEST(test_retries_exhausted);
    RUN_TEST(test_retry_failed_tasks);
    RUN_TEST(test_retry_skips_expired_deadline);
    RUN_TEST(test_resubmit_after_expired_assignment);
    RUN_TEST(test_validation_errors);
    RUN_TEST(test_invalid_params);
    RUN_TEST(test_agent_ids_trimmed);

    // Side effect tests
    RUN_TEST(test_store_and_callback);
    RUN_TEST(test_store_failure_logged);
    RUN_TEST(test_stats);

    // Maintenance tests
    RUN_TEST(test_maintenance_run_once);
    RUN_TEST(test_maintenance_thread);
    RUN_TEST(test_maintenance_concurrent_start);

    // Concurrency tests
    RUN_TEST(test_concurrent_assignment);

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;

    if (failed == 0) {
        std::cout << std::endl << "All tests passed! ✓" << std::endl;
        return 0;
    } else {
        std::cout << std::endl << "Some tests failed! ✗" << std::endl;
        return 1;
    }
}
