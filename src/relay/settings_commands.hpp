#pragma once

#include "settings.hpp"

#include <expected>
#include <string>

// Settings mutations. Each runs inside SettingsStore::update: the current
// file is loaded, the request is validated against it, and the modified
// copy is persisted under the store lock. Nothing is written when
// validation fails or the existing file cannot be parsed.
namespace settings_cmd {

SttApiSettings get_stt_api_settings(const SettingsStore& store);

std::expected<void, std::string> set_stt_api_enabled(SettingsStore& store, bool enabled);

std::expected<void, std::string> set_stt_api_provider(SettingsStore& store,
                                                      const std::string& provider_id);

// Only providers that allow base URL edits (the "custom" provider) accept this.
std::expected<void, std::string> set_stt_api_base_url(SettingsStore& store,
                                                      const std::string& provider_id,
                                                      const std::string& base_url);

std::expected<void, std::string> set_stt_api_key(SettingsStore& store,
                                                 const std::string& provider_id,
                                                 const std::string& api_key);

std::expected<void, std::string> set_stt_api_model(SettingsStore& store,
                                                   const std::string& provider_id,
                                                   const std::string& model);

// An empty language resets to "auto".
std::expected<void, std::string> set_selected_language(SettingsStore& store,
                                                       const std::string& language);

} // namespace settings_cmd
