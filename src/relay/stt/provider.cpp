#include "stt/provider.hpp"

std::expected<ResolvedProvider, SttError> resolve_provider(const Settings& settings) {
    const auto& stt = settings.stt_api;
    if (!stt.enabled) {
        return std::unexpected(SttError::not_enabled());
    }

    const auto* provider = stt.active_provider();
    if (!provider) {
        return std::unexpected(SttError::no_provider_configured());
    }

    ResolvedProvider resolved{.provider = *provider, .model = kDefaultSttModel};

    if (auto it = stt.api_keys.find(provider->id); it != stt.api_keys.end()) {
        resolved.api_key = it->second;
    }
    if (auto it = stt.models.find(provider->id); it != stt.models.end()) {
        resolved.model = it->second;
    }

    // "auto" lets the server detect the language
    if (!settings.selected_language.empty() && settings.selected_language != "auto") {
        resolved.language = settings.selected_language;
    }

    return resolved;
}
