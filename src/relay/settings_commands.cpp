#include "settings_commands.hpp"

#include <format>

namespace settings_cmd {

namespace {

std::string provider_not_found(const std::string& provider_id) {
    return std::format("Provider '{}' not found", provider_id);
}

} // namespace

SttApiSettings get_stt_api_settings(const SettingsStore& store) {
    return store.get().stt_api;
}

std::expected<void, std::string> set_stt_api_enabled(SettingsStore& store, bool enabled) {
    return store.update([&](Settings& settings) -> std::expected<void, std::string> {
        settings.stt_api.enabled = enabled;
        return {};
    });
}

std::expected<void, std::string> set_stt_api_provider(SettingsStore& store,
                                                      const std::string& provider_id) {
    return store.update([&](Settings& settings) -> std::expected<void, std::string> {
        if (!settings.stt_api.find_provider(provider_id)) {
            return std::unexpected(provider_not_found(provider_id));
        }
        settings.stt_api.provider_id = provider_id;
        return {};
    });
}

std::expected<void, std::string> set_stt_api_base_url(SettingsStore& store,
                                                      const std::string& provider_id,
                                                      const std::string& base_url) {
    return store.update([&](Settings& settings) -> std::expected<void, std::string> {
        auto* provider = settings.stt_api.find_provider(provider_id);
        if (!provider) {
            return std::unexpected(provider_not_found(provider_id));
        }
        if (!provider->allow_base_url_edit) {
            return std::unexpected(std::format(
                "Provider '{}' does not allow editing the base URL", provider->label));
        }
        provider->base_url = base_url;
        return {};
    });
}

std::expected<void, std::string> set_stt_api_key(SettingsStore& store,
                                                 const std::string& provider_id,
                                                 const std::string& api_key) {
    return store.update([&](Settings& settings) -> std::expected<void, std::string> {
        if (!settings.stt_api.find_provider(provider_id)) {
            return std::unexpected(provider_not_found(provider_id));
        }
        settings.stt_api.api_keys[provider_id] = api_key;
        return {};
    });
}

std::expected<void, std::string> set_stt_api_model(SettingsStore& store,
                                                   const std::string& provider_id,
                                                   const std::string& model) {
    return store.update([&](Settings& settings) -> std::expected<void, std::string> {
        if (!settings.stt_api.find_provider(provider_id)) {
            return std::unexpected(provider_not_found(provider_id));
        }
        settings.stt_api.models[provider_id] = model;
        return {};
    });
}

std::expected<void, std::string> set_selected_language(SettingsStore& store,
                                                       const std::string& language) {
    return store.update([&](Settings& settings) -> std::expected<void, std::string> {
        settings.selected_language = language.empty() ? "auto" : language;
        return {};
    });
}

} // namespace settings_cmd
