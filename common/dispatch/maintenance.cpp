#include "maintenance.h"
#include "log.h"

#include <chrono>

namespace dispatch {

maintenance_loop::maintenance_loop(scheduler& sched, int64_t interval_ms)
    : sched(sched), interval_ms(interval_ms), running(false), iterations(0) {
    if (interval_ms <= 0) {
        throw validation_error("maintenance interval must be positive");
    }
}

maintenance_loop::~maintenance_loop() {
    stop();
}

void maintenance_loop::start() {
    if (running.exchange(true)) {
        return;
    }

    worker_thread = std::thread(&maintenance_loop::worker_loop, this);

    LOG_INF("maintenance loop started, interval %lld ms\n", (long long) interval_ms);
}

void maintenance_loop::stop() {
    if (!running.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex);
        running.store(false);
    }
    wake_cv.notify_all();
    if (worker_thread.joinable()) {
        worker_thread.join();
    }

    LOG_INF("maintenance loop stopped\n");
}

void maintenance_loop::run_once() {
    const size_t timed_out = sched.check_task_timeouts();
    const size_t assigned = sched.process_backlog();
    iterations++;

    LOG_DBG("maintenance pass: %zu timed out, %zu assigned from backlog\n", timed_out, assigned);
}

void maintenance_loop::worker_loop() {
    while (running.load()) {
        try {
            run_once();
        } catch (const std::exception& e) {
            LOG_ERR("maintenance pass failed: %s\n", e.what());
        }

        std::unique_lock<std::mutex> lock(wake_mutex);
        wake_cv.wait_for(lock, std::chrono::milliseconds(interval_ms),
                         [this] { return !running.load(); });
    }
}

} // namespace dispatch
