#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace dispatch {

// Malformed input, raised before any state change
class validation_error : public std::invalid_argument {
public:
    explicit validation_error(const std::string& what) : std::invalid_argument(what) {}
};

// Clock source returning Unix epoch milliseconds
using clock_fn = std::function<int64_t()>;

// Generate UUID v4 for store records
std::string generate_uuid();

// Get current timestamp in milliseconds
int64_t get_timestamp_ms();

// True if the string is empty or whitespace only
bool is_blank(const std::string& str);

// Strip leading and trailing whitespace
std::string trim(const std::string& str);

} // namespace dispatch
