#include "util.h"

#include <cctype>
#include <chrono>
#include <mutex>
#include <random>
#include <sstream>

namespace dispatch {

std::string generate_uuid() {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::uniform_int_distribution<> dis2(8, 11);

    std::lock_guard<std::mutex> lock(mutex);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 8; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 4; i++) {
        ss << dis(gen);
    }
    ss << "-4";
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 12; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

int64_t get_timestamp_ms() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

bool is_blank(const std::string& str) {
    for (unsigned char c : str) {
        if (!std::isspace(c)) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) end--;
    return str.substr(begin, end - begin);
}

} // namespace dispatch
