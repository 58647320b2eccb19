#pragma once

/**
 * Settings persistence for mllm-chat.
 *
 * Loads and saves configured providers, the active provider and the web
 * search settings in a local JSON file.
 */

#include "chat/types.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mllm {

/**
 * Thrown when the settings file exists but cannot be read or parsed.
 */
class SettingsError : public std::runtime_error {
public:
    explicit SettingsError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * One configured OpenAI-compatible endpoint.
 */
struct Provider {
    std::string id;
    std::string name;
    std::string base_url;
    std::string api_key;
    std::string selected_model;
    std::string system_prompt;
    std::optional<float> temperature;
    std::optional<int> max_tokens;
    std::vector<std::string> available_models;
    int64_t last_fetched_models = 0;  // Unix time in milliseconds.

    // The selected model, else the first available one, else the default.
    std::string effective_model() const;

    chat::ApiConfig to_api_config() const;
};

struct Settings {
    std::vector<Provider> providers;
    std::string active_provider_id;
    chat::WebSearchConfig web_search;

    // The active provider, or the first one if the id does not match.
    const Provider* active_provider() const;
    Provider* active_provider();

    // Looks a provider up by id, then by name.
    Provider* find_provider(const std::string& id_or_name);
};

// Loads settings from path. Returns empty optional if the file doesn't exist.
// Throws SettingsError if it exists but is unreadable.
std::optional<Settings> load_settings(const std::string& path);

// Saves settings to path. Throws SettingsError on write failure.
void save_settings(const Settings& settings, const std::string& path);

} // namespace mllm
