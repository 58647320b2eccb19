#include "settings.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace mllm {

using json = nlohmann::json;

std::string Provider::effective_model() const {
    if (selected_model.find_first_not_of(" \t") != std::string::npos) {
        return selected_model;
    }
    if (!available_models.empty()) {
        return available_models.front();
    }
    return DEFAULT_MODEL;
}

chat::ApiConfig Provider::to_api_config() const {
    chat::ApiConfig config;
    config.base_url = base_url.empty() ? DEFAULT_API_BASE : base_url;
    config.api_key = api_key;
    config.model = effective_model();
    config.system_prompt = system_prompt;
    config.temperature = temperature;
    config.max_tokens = max_tokens;
    config.provider_name = name;
    return config;
}

const Provider* Settings::active_provider() const {
    for (const auto& provider : providers) {
        if (provider.id == active_provider_id) {
            return &provider;
        }
    }
    return providers.empty() ? nullptr : &providers.front();
}

Provider* Settings::active_provider() {
    return const_cast<Provider*>(static_cast<const Settings*>(this)->active_provider());
}

Provider* Settings::find_provider(const std::string& id_or_name) {
    for (auto& provider : providers) {
        if (provider.id == id_or_name) {
            return &provider;
        }
    }
    for (auto& provider : providers) {
        if (provider.name == id_or_name) {
            return &provider;
        }
    }
    return nullptr;
}

static Provider provider_from_json(const json& j) {
    Provider provider;
    provider.id = j.value("id", "");
    provider.name = j.value("name", "");
    provider.base_url = j.value("base_url", "");
    provider.api_key = j.value("api_key", "");
    provider.selected_model = j.value("selected_model", "");
    provider.system_prompt = j.value("system_prompt", "");

    if (j.contains("temperature") && j["temperature"].is_number()) {
        provider.temperature = j["temperature"].get<float>();
    }
    if (j.contains("max_tokens") && j["max_tokens"].is_number_integer()) {
        provider.max_tokens = j["max_tokens"].get<int>();
    }

    if (j.contains("available_models") && j["available_models"].is_array()) {
        for (const auto& model : j["available_models"]) {
            if (model.is_string()) {
                provider.available_models.push_back(model.get<std::string>());
            }
        }
    }
    provider.last_fetched_models = j.value("last_fetched_models", int64_t(0));
    return provider;
}

static json provider_to_json(const Provider& provider) {
    json j = {
        {"id", provider.id},
        {"name", provider.name},
        {"base_url", provider.base_url},
        {"api_key", provider.api_key},
        {"selected_model", provider.selected_model},
        {"system_prompt", provider.system_prompt},
        {"available_models", provider.available_models},
        {"last_fetched_models", provider.last_fetched_models}
    };
    if (provider.temperature) {
        j["temperature"] = *provider.temperature;
    }
    if (provider.max_tokens) {
        j["max_tokens"] = *provider.max_tokens;
    }
    return j;
}

std::optional<Settings> load_settings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw SettingsError("Cannot open settings file: " + path);
    }

    try {
        json j;
        file >> j;

        Settings settings;
        settings.active_provider_id = j.value("active_provider_id", "");

        if (j.contains("providers") && j["providers"].is_array()) {
            for (const auto& provider_json : j["providers"]) {
                if (!provider_json.is_object()) {
                    continue;
                }
                Provider provider = provider_from_json(provider_json);
                if (!provider.id.empty()) {
                    settings.providers.push_back(provider);
                }
            }
        }

        if (j.contains("web_search") && j["web_search"].is_object()) {
            const auto& ws = j["web_search"];
            settings.web_search.enabled = ws.value("enabled", false);
            settings.web_search.api_key = ws.value("api_key", "");
            settings.web_search.provider = ws.value("provider", DEFAULT_SEARCH_PROVIDER);
        }

        return settings;
    } catch (const json::exception& e) {
        throw SettingsError("Invalid settings file " + path + ": " + e.what());
    }
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["active_provider_id"] = settings.active_provider_id;

    json providers_json = json::array();
    for (const auto& provider : settings.providers) {
        providers_json.push_back(provider_to_json(provider));
    }
    j["providers"] = providers_json;

    j["web_search"] = {
        {"enabled", settings.web_search.enabled},
        {"api_key", settings.web_search.api_key},
        {"provider", settings.web_search.provider}
    };

    std::ofstream file(path);
    if (!file.is_open()) {
        throw SettingsError("Cannot write settings file: " + path);
    }
    file << j.dump(2) << std::endl;
}

} // namespace mllm
