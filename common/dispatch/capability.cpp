#include "capability.h"
#include "log.h"
#include "util.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>

using json = nlohmann::json;

namespace dispatch {

static const char* const capability_names[] = {
    "creative_writing",
    "technical_writing",
    "translation",
    "summarization",
    "code_generation",
    "code_review",
    "code_optimization",
    "code_documentation",
    "math_reasoning",
    "logical_reasoning",
    "critical_analysis",
    "data_analysis",
    "data_visualization",
    "research",
    "fact_checking",
    "scientific_reasoning",
    "legal_analysis",
    "medical_knowledge",
    "financial_analysis",
    "task_planning",
    "task_prioritization",
    "resource_management",
    "computer_use",
};

static_assert(sizeof(capability_names) / sizeof(capability_names[0]) == CAPABILITY_COUNT,
              "capability_names must cover every capability");

bool is_valid_capability(capability cap) {
    return static_cast<int>(cap) >= 0 && static_cast<int>(cap) < CAPABILITY_COUNT;
}

const char* capability_to_string(capability cap) {
    if (!is_valid_capability(cap)) {
        return "unknown";
    }
    return capability_names[cap];
}

std::optional<capability> capability_from_string(const std::string& str) {
    for (int i = 0; i < CAPABILITY_COUNT; i++) {
        if (str == capability_names[i]) {
            return static_cast<capability>(i);
        }
    }
    return std::nullopt;
}

// No default label: -Wswitch flags any capability left unmapped
capability_category capability_category_of(capability cap) {
    switch (cap) {
        case CAPABILITY_CREATIVE_WRITING:
        case CAPABILITY_TECHNICAL_WRITING:
        case CAPABILITY_TRANSLATION:
        case CAPABILITY_SUMMARIZATION:
            return CAPABILITY_CATEGORY_LANGUAGE;
        case CAPABILITY_CODE_GENERATION:
        case CAPABILITY_CODE_REVIEW:
        case CAPABILITY_CODE_OPTIMIZATION:
        case CAPABILITY_CODE_DOCUMENTATION:
            return CAPABILITY_CATEGORY_CODE;
        case CAPABILITY_MATH_REASONING:
        case CAPABILITY_LOGICAL_REASONING:
        case CAPABILITY_CRITICAL_ANALYSIS:
            return CAPABILITY_CATEGORY_REASONING;
        case CAPABILITY_DATA_ANALYSIS:
        case CAPABILITY_DATA_VISUALIZATION:
        case CAPABILITY_RESEARCH:
        case CAPABILITY_FACT_CHECKING:
            return CAPABILITY_CATEGORY_DATA;
        case CAPABILITY_SCIENTIFIC_REASONING:
        case CAPABILITY_LEGAL_ANALYSIS:
        case CAPABILITY_MEDICAL_KNOWLEDGE:
        case CAPABILITY_FINANCIAL_ANALYSIS:
            return CAPABILITY_CATEGORY_DOMAIN;
        case CAPABILITY_TASK_PLANNING:
        case CAPABILITY_TASK_PRIORITIZATION:
        case CAPABILITY_RESOURCE_MANAGEMENT:
            return CAPABILITY_CATEGORY_TASK;
        case CAPABILITY_COMPUTER_USE:
            return CAPABILITY_CATEGORY_MODEL;
        case CAPABILITY_COUNT:
            break;
    }
    throw validation_error("invalid capability value: " + std::to_string(static_cast<int>(cap)));
}

const char* capability_category_to_string(capability_category category) {
    switch (category) {
        case CAPABILITY_CATEGORY_LANGUAGE:  return "LANGUAGE";
        case CAPABILITY_CATEGORY_CODE:      return "CODE";
        case CAPABILITY_CATEGORY_REASONING: return "REASONING";
        case CAPABILITY_CATEGORY_DATA:      return "DATA";
        case CAPABILITY_CATEGORY_DOMAIN:    return "DOMAIN";
        case CAPABILITY_CATEGORY_TASK:      return "TASK";
        case CAPABILITY_CATEGORY_MODEL:     return "MODEL";
        default:                            return "UNKNOWN";
    }
}

std::optional<capability_category> capability_category_from_string(const std::string& str) {
    static const capability_category all[] = {
        CAPABILITY_CATEGORY_LANGUAGE, CAPABILITY_CATEGORY_CODE, CAPABILITY_CATEGORY_REASONING,
        CAPABILITY_CATEGORY_DATA, CAPABILITY_CATEGORY_DOMAIN, CAPABILITY_CATEGORY_TASK,
        CAPABILITY_CATEGORY_MODEL,
    };
    std::string upper = trim(str);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    for (auto category : all) {
        if (upper == capability_category_to_string(category)) {
            return category;
        }
    }
    return std::nullopt;
}

// agent_capability implementation
agent_capability::agent_capability()
    : cap(CAPABILITY_CREATIVE_WRITING), strength(0.0), last_updated(get_timestamp_ms()) {}

agent_capability::agent_capability(capability cap, double strength,
                                   std::map<std::string, std::string> metadata)
    : cap(cap), strength(strength), last_updated(get_timestamp_ms()), metadata(std::move(metadata)) {}

void agent_capability::validate() const {
    if (!is_valid_capability(cap)) {
        throw validation_error("invalid capability value: " + std::to_string(static_cast<int>(cap)));
    }
    if (!(strength >= 0.0 && strength <= 1.0)) {
        throw validation_error("strength must be between 0.0 and 1.0, got " + std::to_string(strength));
    }
}

static json capability_to_json_obj(const agent_capability& c) {
    return json{
        {"capability", capability_to_string(c.cap)},
        {"strength", c.strength},
        {"last_updated", c.last_updated},
        {"metadata", c.metadata}
    };
}

static agent_capability capability_from_json_obj(const json& j) {
    auto cap = capability_from_string(j.at("capability").get<std::string>());
    if (!cap) {
        throw validation_error("unknown capability: " + j.at("capability").get<std::string>());
    }

    agent_capability c;
    c.cap = *cap;
    c.strength = j.at("strength").get<double>();
    c.last_updated = j.value("last_updated", get_timestamp_ms());
    c.metadata = j.value("metadata", std::map<std::string, std::string>());
    c.validate();
    return c;
}

std::string agent_capability::to_json() const {
    return capability_to_json_obj(*this).dump();
}

agent_capability agent_capability::from_json(const std::string& json_str) {
    try {
        return capability_from_json_obj(json::parse(json_str));
    } catch (const json::exception& e) {
        throw validation_error(std::string("malformed capability JSON: ") + e.what());
    }
}

// Every entry valid and each capability listed at most once
static void validate_profile(const std::vector<agent_capability>& capabilities) {
    bool seen[CAPABILITY_COUNT] = {};
    for (const auto& c : capabilities) {
        c.validate();
        if (seen[c.cap]) {
            throw validation_error(std::string("duplicate capability ") + capability_to_string(c.cap) +
                                   " in agent profile");
        }
        seen[c.cap] = true;
    }
}

// capability_registry implementation
struct capability_registry::impl {
    std::map<std::string, std::vector<agent_capability>> agents;
    std::string storage_path;
    mutable std::mutex mutex;

    // Serializes file writes; snapshots older than the last write are dropped
    std::mutex persist_mutex;
    uint64_t version = 0;
    uint64_t written_version = 0;

    json snapshot_locked() const {
        json j = json::object();
        for (const auto& [id, caps] : agents) {
            json list = json::array();
            for (const auto& c : caps) {
                list.push_back(capability_to_json_obj(c));
            }
            j[id] = list;
        }
        return j;
    }

    static std::map<std::string, std::vector<agent_capability>> parse_state(const json& j) {
        std::map<std::string, std::vector<agent_capability>> parsed;
        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& id = it.key();
            if (is_blank(id)) {
                throw validation_error("agent_id must be a non-empty string");
            }
            std::vector<agent_capability> caps;
            for (const auto& entry : it.value()) {
                caps.push_back(capability_from_json_obj(entry));
            }
            validate_profile(caps);
            parsed[trim(id)] = std::move(caps);
        }
        return parsed;
    }

    void load() {
        if (storage_path.empty()) {
            return;
        }

        std::ifstream in(storage_path);
        if (!in) {
            LOG_INF("no capability storage found at %s\n", storage_path.c_str());
            return;
        }

        try {
            json j = json::parse(in);
            agents = parse_state(j);
            LOG_INF("loaded capabilities for %zu agents from %s\n", agents.size(), storage_path.c_str());
        } catch (const std::exception& e) {
            LOG_ERR("failed to load capabilities from %s: %s\n", storage_path.c_str(), e.what());
            agents.clear();
        }
    }

    // Called after the registry lock is released
    void persist(const json& snapshot, uint64_t snapshot_version) {
        std::lock_guard<std::mutex> lock(persist_mutex);
        if (snapshot_version <= written_version) {
            return;
        }

        try {
            std::ofstream out(storage_path, std::ios::trunc);
            if (!out) {
                LOG_ERR("failed to open capability storage %s for writing\n", storage_path.c_str());
                return;
            }
            out << snapshot.dump(2);
            if (!out) {
                LOG_ERR("failed to write capability storage %s\n", storage_path.c_str());
                return;
            }
            written_version = snapshot_version;
            LOG_DBG("saved capabilities for %zu agents\n", snapshot.size());
        } catch (const std::exception& e) {
            LOG_ERR("failed to save capabilities: %s\n", e.what());
        }
    }
};

static std::string checked_agent_id(const std::string& agent_id) {
    if (is_blank(agent_id)) {
        throw validation_error("agent_id must be a non-empty string");
    }
    return trim(agent_id);
}

capability_registry::capability_registry(const std::string& storage_path)
    : pimpl(std::make_unique<impl>()) {
    pimpl->storage_path = storage_path;
    pimpl->load();
}

capability_registry::~capability_registry() = default;

void capability_registry::register_agent(const std::string& agent_id,
                                         const std::vector<agent_capability>& capabilities) {
    const std::string id = checked_agent_id(agent_id);

    if (capabilities.empty()) {
        throw validation_error("capabilities list cannot be empty");
    }
    validate_profile(capabilities);

    json snapshot;
    uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->agents[id] = capabilities;
        if (!pimpl->storage_path.empty()) {
            snapshot = pimpl->snapshot_locked();
            version = ++pimpl->version;
        }
    }

    LOG_INF("registered %zu capabilities for agent %s\n", capabilities.size(), id.c_str());
    if (version) {
        pimpl->persist(snapshot, version);
    }
}

bool capability_registry::unregister_agent(const std::string& agent_id) {
    const std::string id = checked_agent_id(agent_id);

    json snapshot;
    uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        if (pimpl->agents.erase(id) == 0) {
            return false;
        }
        if (!pimpl->storage_path.empty()) {
            snapshot = pimpl->snapshot_locked();
            version = ++pimpl->version;
        }
    }

    LOG_INF("unregistered agent %s\n", id.c_str());
    if (version) {
        pimpl->persist(snapshot, version);
    }
    return true;
}

bool capability_registry::update_capability(const std::string& agent_id, const agent_capability& capability) {
    const std::string id = checked_agent_id(agent_id);
    capability.validate();

    json snapshot;
    uint64_t version = 0;
    bool appended = true;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->agents.find(id);
        if (it != pimpl->agents.end()) {
            found = true;

            for (auto& existing : it->second) {
                if (existing.cap == capability.cap) {
                    existing = capability;
                    appended = false;
                    break;
                }
            }
            if (appended) {
                it->second.push_back(capability);
            }

            if (!pimpl->storage_path.empty()) {
                snapshot = pimpl->snapshot_locked();
                version = ++pimpl->version;
            }
        }
    }

    if (!found) {
        LOG_WRN("agent %s not found in registry\n", id.c_str());
        return false;
    }

    LOG_INF("%s capability %s for agent %s\n", appended ? "added" : "updated",
            capability_to_string(capability.cap), id.c_str());
    if (version) {
        pimpl->persist(snapshot, version);
    }
    return true;
}

bool capability_registry::remove_capability(const std::string& agent_id, capability cap) {
    const std::string id = checked_agent_id(agent_id);
    if (!is_valid_capability(cap)) {
        throw validation_error("invalid capability value: " + std::to_string(static_cast<int>(cap)));
    }

    json snapshot;
    uint64_t version = 0;
    bool found = false;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->agents.find(id);
        if (it != pimpl->agents.end()) {
            found = true;

            auto& caps = it->second;
            const size_t before = caps.size();
            caps.erase(std::remove_if(caps.begin(), caps.end(),
                                      [cap](const agent_capability& c) { return c.cap == cap; }),
                       caps.end());
            removed = caps.size() != before;

            if (removed && !pimpl->storage_path.empty()) {
                snapshot = pimpl->snapshot_locked();
                version = ++pimpl->version;
            }
        }
    }

    if (!found) {
        LOG_WRN("agent %s not found in registry\n", id.c_str());
        return false;
    }
    if (!removed) {
        return false;
    }

    LOG_INF("removed capability %s from agent %s\n", capability_to_string(cap), id.c_str());
    if (version) {
        pimpl->persist(snapshot, version);
    }
    return true;
}

std::optional<std::vector<agent_capability>> capability_registry::get_agent_capabilities(const std::string& agent_id) const {
    const std::string id = checked_agent_id(agent_id);

    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->agents.find(id);
    if (it == pimpl->agents.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool capability_registry::has_agent(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->agents.count(trim(agent_id)) > 0;
}

std::vector<std::string> capability_registry::list_agents() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<std::string> ids;
    ids.reserve(pimpl->agents.size());
    for (const auto& [id, caps] : pimpl->agents) {
        ids.push_back(id);
    }
    return ids;
}

std::map<std::string, std::vector<agent_capability>> capability_registry::get_agents_by_category(capability_category category) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::map<std::string, std::vector<agent_capability>> result;
    for (const auto& [id, caps] : pimpl->agents) {
        std::vector<agent_capability> matching;
        for (const auto& c : caps) {
            if (capability_category_of(c.cap) == category) {
                matching.push_back(c);
            }
        }
        if (!matching.empty()) {
            result[id] = std::move(matching);
        }
    }
    return result;
}

std::optional<std::string> capability_registry::find_best_agent(capability cap) const {
    if (!is_valid_capability(cap)) {
        throw validation_error("invalid capability value: " + std::to_string(static_cast<int>(cap)));
    }

    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::optional<std::string> best_agent;
    double best_strength = 0.0;

    // std::map iterates in id order, so the strict comparison keeps the lowest id on ties
    for (const auto& [id, caps] : pimpl->agents) {
        for (const auto& c : caps) {
            if (c.cap == cap && c.strength > best_strength) {
                best_agent = id;
                best_strength = c.strength;
            }
        }
    }

    if (!best_agent) {
        LOG_DBG("no agent found with capability %s\n", capability_to_string(cap));
    }
    return best_agent;
}

std::vector<std::string> capability_registry::find_agents_with_capability(capability cap, double min_strength) const {
    if (!is_valid_capability(cap)) {
        throw validation_error("invalid capability value: " + std::to_string(static_cast<int>(cap)));
    }
    if (!(min_strength >= 0.0 && min_strength <= 1.0)) {
        throw validation_error("min_strength must be between 0.0 and 1.0");
    }

    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<std::string> qualified;
    for (const auto& [id, caps] : pimpl->agents) {
        for (const auto& c : caps) {
            if (c.cap == cap && c.strength >= min_strength) {
                qualified.push_back(id);
                break;
            }
        }
    }
    return qualified;
}

capability_matrix capability_registry::get_capability_matrix() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    capability_matrix matrix;
    for (const auto& [id, caps] : pimpl->agents) {
        auto& row = matrix[id];
        for (const auto& c : caps) {
            row[c.cap] = c.strength;
        }
    }
    return matrix;
}

std::string capability_registry::export_state() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->snapshot_locked().dump();
}

bool capability_registry::import_state(const std::string& json_str) {
    std::map<std::string, std::vector<agent_capability>> parsed;
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            LOG_ERR("capability state must be a JSON object\n");
            return false;
        }
        parsed = impl::parse_state(j);
    } catch (const std::exception& e) {
        LOG_ERR("failed to import capability state: %s\n", e.what());
        return false;
    }

    json snapshot;
    uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->agents = std::move(parsed);
        if (!pimpl->storage_path.empty()) {
            snapshot = pimpl->snapshot_locked();
            version = ++pimpl->version;
        }
    }

    if (version) {
        pimpl->persist(snapshot, version);
    }
    return true;
}

const std::string& capability_registry::get_storage_path() const {
    return pimpl->storage_path;
}

} // namespace dispatch
