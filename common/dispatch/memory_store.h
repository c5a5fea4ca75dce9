#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace dispatch {

// A persisted progress or failure record
struct memory_record {
    std::string id;
    std::string owner_id;    // Task or subtask the record belongs to
    std::string kind;        // "task_assigned", "subtask_progress", ...
    std::string content;     // JSON payload
    int64_t stored_at;
};

// Abstract store for task progress. Callers treat it as best effort:
// a throwing store is logged and never unwinds scheduler state.
class memory_store_i {
public:
    virtual ~memory_store_i() = default;

    // Store a record, returns its id
    virtual std::string store(const std::string& owner_id,
                              const std::string& kind,
                              const std::string& content) = 0;
};

// Bounded in-process store
class in_memory_store : public memory_store_i {
public:
    explicit in_memory_store(size_t max_records = 100000) : max_records(max_records) {}

    std::string store(const std::string& owner_id,
                      const std::string& kind,
                      const std::string& content) override;

    // Records for an owner, oldest first (empty kind = any kind)
    std::vector<memory_record> get_records(const std::string& owner_id,
                                           const std::string& kind = "") const;

    std::vector<memory_record> get_records_by_kind(const std::string& kind) const;

    size_t size() const;
    void clear();

private:
    size_t max_records;
    std::deque<memory_record> records;
    mutable std::mutex mutex;
};

} // namespace dispatch
