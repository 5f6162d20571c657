#pragma once

#include "settings.hpp"
#include "stt/error.hpp"

#include <expected>
#include <optional>
#include <string>

inline constexpr const char* kDefaultSttModel = "whisper-1";

// Everything one request needs, copied out of a settings snapshot.
struct ResolvedProvider {
    SttApiProvider provider;
    std::string api_key;
    std::string model;
    std::optional<std::string> language;
};

// Checks the enabled flag and looks up the active provider. A missing API key
// resolves to empty and a missing model to kDefaultSttModel.
std::expected<ResolvedProvider, SttError> resolve_provider(const Settings& settings);
