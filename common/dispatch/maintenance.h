#pragma once

#include "scheduler.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace dispatch {

// Background thread that periodically times out stale assignments and
// drains the backlog
class maintenance_loop {
public:
    // The scheduler must outlive the loop
    maintenance_loop(scheduler& sched, int64_t interval_ms);
    ~maintenance_loop();

    maintenance_loop(const maintenance_loop&) = delete;
    maintenance_loop& operator=(const maintenance_loop&) = delete;

    void start();
    void stop();
    bool is_running() const { return running.load(); }

    // One timeout sweep followed by a backlog drain
    void run_once();

    // Completed passes since construction
    uint64_t get_iterations() const { return iterations.load(); }

private:
    scheduler& sched;
    int64_t interval_ms;

    std::atomic<bool> running;
    std::atomic<uint64_t> iterations;
    std::thread worker_thread;

    std::mutex wake_mutex;
    std::condition_variable wake_cv;

    void worker_loop();
};

} // namespace dispatch
