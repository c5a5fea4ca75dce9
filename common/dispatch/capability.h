#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dispatch {

// Skills an agent may possess
enum capability {
    // Language
    CAPABILITY_CREATIVE_WRITING,
    CAPABILITY_TECHNICAL_WRITING,
    CAPABILITY_TRANSLATION,
    CAPABILITY_SUMMARIZATION,

    // Code
    CAPABILITY_CODE_GENERATION,
    CAPABILITY_CODE_REVIEW,
    CAPABILITY_CODE_OPTIMIZATION,
    CAPABILITY_CODE_DOCUMENTATION,

    // Reasoning
    CAPABILITY_MATH_REASONING,
    CAPABILITY_LOGICAL_REASONING,
    CAPABILITY_CRITICAL_ANALYSIS,

    // Data and research
    CAPABILITY_DATA_ANALYSIS,
    CAPABILITY_DATA_VISUALIZATION,
    CAPABILITY_RESEARCH,
    CAPABILITY_FACT_CHECKING,

    // Domain
    CAPABILITY_SCIENTIFIC_REASONING,
    CAPABILITY_LEGAL_ANALYSIS,
    CAPABILITY_MEDICAL_KNOWLEDGE,
    CAPABILITY_FINANCIAL_ANALYSIS,

    // Task management
    CAPABILITY_TASK_PLANNING,
    CAPABILITY_TASK_PRIORITIZATION,
    CAPABILITY_RESOURCE_MANAGEMENT,

    // Model specific
    CAPABILITY_COMPUTER_USE,

    CAPABILITY_COUNT
};

enum capability_category {
    CAPABILITY_CATEGORY_LANGUAGE,
    CAPABILITY_CATEGORY_CODE,
    CAPABILITY_CATEGORY_REASONING,
    CAPABILITY_CATEGORY_DATA,
    CAPABILITY_CATEGORY_DOMAIN,
    CAPABILITY_CATEGORY_TASK,
    CAPABILITY_CATEGORY_MODEL
};

bool is_valid_capability(capability cap);

// "code_generation", "critical_analysis", ...
const char* capability_to_string(capability cap);
std::optional<capability> capability_from_string(const std::string& str);

capability_category capability_category_of(capability cap);
const char* capability_category_to_string(capability_category category);
std::optional<capability_category> capability_category_from_string(const std::string& str);

// A capability held by an agent, with its strength in [0, 1]
struct agent_capability {
    capability cap;
    double strength;
    int64_t last_updated;        // Unix epoch ms
    std::map<std::string, std::string> metadata;

    agent_capability();
    agent_capability(capability cap, double strength,
                     std::map<std::string, std::string> metadata = {});

    // Throws validation_error on an unknown capability or out-of-range strength
    void validate() const;

    std::string to_json() const;
    static agent_capability from_json(const std::string& json_str);
};

// agent_id -> capability -> strength
using capability_matrix = std::map<std::string, std::map<capability, double>>;

// Thread-safe store of per-agent capability profiles.
//
// All mutations are serialized under one mutex. When a storage path is
// configured the full registry is written to it as JSON after each mutation,
// outside the lock; write failures are logged and never fail the call.
class capability_registry {
public:
    explicit capability_registry(const std::string& storage_path = "");
    ~capability_registry();

    capability_registry(const capability_registry&) = delete;
    capability_registry& operator=(const capability_registry&) = delete;

    // Replace the agent's full profile. Throws validation_error on a blank
    // agent_id, an empty list or an invalid entry; the registry is left
    // unchanged in that case.
    void register_agent(const std::string& agent_id,
                        const std::vector<agent_capability>& capabilities);

    // Drop the agent's profile
    bool unregister_agent(const std::string& agent_id);

    // Update in place or append. Returns false if the agent is unknown.
    bool update_capability(const std::string& agent_id, const agent_capability& capability);

    // Returns whether a removal occurred
    bool remove_capability(const std::string& agent_id, capability cap);

    std::optional<std::vector<agent_capability>> get_agent_capabilities(const std::string& agent_id) const;

    bool has_agent(const std::string& agent_id) const;

    // Registered agent ids, sorted
    std::vector<std::string> list_agents() const;

    // agent_id -> the agent's entries that fall into the category
    std::map<std::string, std::vector<agent_capability>> get_agents_by_category(capability_category category) const;

    // Highest-strength agent for the capability; ties go to the lowest agent_id
    std::optional<std::string> find_best_agent(capability cap) const;

    // Agents holding the capability with strength >= min_strength, sorted by id
    std::vector<std::string> find_agents_with_capability(capability cap, double min_strength = 0.0) const;

    capability_matrix get_capability_matrix() const;

    // Export registry state to JSON
    std::string export_state() const;

    // Replace registry state from JSON (all-or-nothing)
    bool import_state(const std::string& json_str);

    const std::string& get_storage_path() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace dispatch
