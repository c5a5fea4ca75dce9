#include "memory_store.h"
#include "util.h"

namespace dispatch {

std::string in_memory_store::store(const std::string& owner_id,
                                   const std::string& kind,
                                   const std::string& content) {
    memory_record record;
    record.id = generate_uuid();
    record.owner_id = owner_id;
    record.kind = kind;
    record.content = content;
    record.stored_at = get_timestamp_ms();

    std::lock_guard<std::mutex> lock(mutex);
    records.push_back(record);
    while (records.size() > max_records) {
        records.pop_front();
    }
    return record.id;
}

std::vector<memory_record> in_memory_store::get_records(const std::string& owner_id,
                                                        const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<memory_record> result;
    for (const auto& record : records) {
        if (record.owner_id == owner_id && (kind.empty() || record.kind == kind)) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<memory_record> in_memory_store::get_records_by_kind(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<memory_record> result;
    for (const auto& record : records) {
        if (record.kind == kind) {
            result.push_back(record);
        }
    }
    return result;
}

size_t in_memory_store::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return records.size();
}

void in_memory_store::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    records.clear();
}

} // namespace dispatch
