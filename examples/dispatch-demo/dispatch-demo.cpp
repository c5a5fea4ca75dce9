#include "capability.h"
#include "decomposer.h"
#include "log.h"
#include "maintenance.h"
#include "memory_store.h"
#include "params.h"
#include "scheduler.h"

#include <chrono>
#include <iostream>
#include <thread>

using namespace dispatch;

// ============================================================================
// Agent pool shared by the demos
// ============================================================================

static void register_pool(capability_registry& registry, scheduler& sched) {
    registry.register_agent("coder", {
        agent_capability(CAPABILITY_CODE_GENERATION, 0.9),
        agent_capability(CAPABILITY_CODE_REVIEW, 0.7),
        agent_capability(CAPABILITY_CODE_OPTIMIZATION, 0.6)
    });
    registry.register_agent("reviewer", {
        agent_capability(CAPABILITY_CODE_REVIEW, 0.95),
        agent_capability(CAPABILITY_CRITICAL_ANALYSIS, 0.8)
    });
    registry.register_agent("analyst", {
        agent_capability(CAPABILITY_CRITICAL_ANALYSIS, 0.9),
        agent_capability(CAPABILITY_DATA_ANALYSIS, 0.85),
        agent_capability(CAPABILITY_RESEARCH, 0.7)
    });

    for (const auto& id : registry.list_agents()) {
        sched.update_agent_health(id);
    }
}

static task make_task(const std::string& id, std::vector<capability> caps, int priority) {
    task t;
    t.task_id = id;
    t.required_capabilities = std::move(caps);
    t.priority = priority;
    return t;
}

// ============================================================================
// Demo 1: Scoring, capacity and the backlog
// ============================================================================

static void demo_scheduling(const scheduler_params& params) {
    std::cout << "\n=== Demo: Scheduling ===" << std::endl;

    capability_registry registry;
    in_memory_store store;
    scheduler sched(registry, params, &store);
    register_pool(registry, sched);

    for (int i = 0; i < 5; i++) {
        const std::string id = "review-" + std::to_string(i);
        auto agent = sched.assign_task(make_task(id, {CAPABILITY_CODE_REVIEW}, 1 + i % 3));
        std::cout << id << " -> " << (agent ? *agent : "(queued)") << std::endl;
    }

    std::cout << "Queued: " << sched.get_queued_tasks().size() << std::endl;

    const auto tasks = sched.get_agent_tasks("reviewer");
    if (!tasks.empty()) {
        sched.complete_task("reviewer", tasks.front().task_id, std::string("looks good"));
    }

    std::cout << "After one completion: " << sched.get_stats() << std::endl;
    std::cout << "Records stored: " << store.size() << std::endl;
}

// ============================================================================
// Demo 2: Decomposition with dependency-driven assignment
// ============================================================================

static void demo_decomposition(const scheduler_params& params) {
    std::cout << "\n=== Demo: Decomposition ===" << std::endl;

    capability_registry registry;
    in_memory_store store;
    scheduler sched(registry, params, &store);
    task_decomposer decomposer(sched, &store);
    register_pool(registry, sched);

    sched.set_assignment_callback([&](const task_assignment& a) {
        decomposer.handle_assignment(a);
    });

    maintenance_loop maintenance(sched, 100);
    maintenance.start();

    auto subtasks = decomposer.decompose_task(make_task("feature-42", {
        CAPABILITY_CODE_GENERATION, CAPABILITY_CODE_REVIEW, CAPABILITY_CODE_OPTIMIZATION
    }, 2));

    for (const auto& st : subtasks) {
        std::cout << "  step " << st.step_number << ": " << st.task_id
                  << " (complexity " << st.estimated_complexity << ")" << std::endl;
    }

    decomposer.assign_subtasks(subtasks);

    // Simulate agents finishing each step in order
    for (const auto& st : subtasks) {
        auto agent = sched.get_task_agent(st.task_id);
        if (!agent) {
            std::cout << st.task_id << " has no agent, stopping" << std::endl;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        sched.complete_task(*agent, st.task_id);
        decomposer.update_subtask_status(st.task_id, SUBTASK_STATUS_COMPLETED);
        std::cout << st.task_id << " completed by " << *agent << std::endl;
    }

    maintenance.stop();

    for (const auto& st : decomposer.get_subtasks_for_task("feature-42")) {
        std::cout << "  " << st.task_id << ": " << subtask_status_to_string(st.status) << std::endl;
    }
}

int main(int argc, char** argv) {
    std::cout << "==================================================" << std::endl;
    std::cout << "  Agent Dispatch Demo" << std::endl;
    std::cout << "==================================================" << std::endl;

    try {
        scheduler_params params = argc > 1 ? scheduler_params_from_file(argv[1])
                                           : scheduler_default_params();
        if (!apply_log_params(params)) {
            std::cerr << "Warning: log settings not applied" << std::endl;
        }

        demo_scheduling(params);
        demo_decomposition(params);

        std::cout << "\n==================================================" << std::endl;
        std::cout << "  All demos completed successfully!" << std::endl;
        std::cout << "==================================================" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
