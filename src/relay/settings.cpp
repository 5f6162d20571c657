#include "settings.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kCustomProviderId = "custom";

void apply_stt_api(const json& j, SttApiSettings& s) {
    if (j.contains("enabled")) s.enabled = j["enabled"].get<bool>();
    if (j.contains("provider_id")) s.provider_id = j["provider_id"].get<std::string>();
    if (j.contains("api_keys")) s.api_keys = j["api_keys"].get<std::map<std::string, std::string>>();
    if (j.contains("models")) s.models = j["models"].get<std::map<std::string, std::string>>();

    if (j.contains("providers")) {
        std::vector<SttApiProvider> providers;
        for (auto& p : j["providers"]) {
            SttApiProvider provider{
                .id = p.at("id").get<std::string>(),
                .label = p.value("label", ""),
                .base_url = p.value("base_url", ""),
            };
            if (provider.id.empty() || std::ranges::any_of(providers, [&](const SttApiProvider& e) {
                    return e.id == provider.id;
                })) {
                std::println(stderr, "settings: skipping provider with empty or duplicate id '{}'",
                             provider.id);
                continue;
            }
            if (provider.label.empty()) provider.label = provider.id;
            providers.push_back(std::move(provider));
        }
        s.providers = std::move(providers);
    }
}

// Editability follows the id, fixed providers keep their built-in URL, and
// built-in providers missing from the stored list are appended.
void normalize_providers(SttApiSettings& s) {
    auto defaults = default_stt_api_providers();

    for (auto& p : s.providers) {
        p.allow_base_url_edit = p.id == kCustomProviderId;
        if (p.allow_base_url_edit) continue;
        auto it = std::ranges::find(defaults, p.id, &SttApiProvider::id);
        if (it != defaults.end()) p.base_url = it->base_url;
    }

    for (auto& d : defaults) {
        if (!s.find_provider(d.id)) s.providers.push_back(d);
    }
}

json to_json(const SttApiSettings& s) {
    json providers = json::array();
    for (auto& p : s.providers) {
        providers.push_back({{"id", p.id}, {"label", p.label}, {"base_url", p.base_url}});
    }
    return {
        {"enabled", s.enabled},
        {"provider_id", s.provider_id},
        {"providers", std::move(providers)},
        {"api_keys", s.api_keys},
        {"models", s.models},
    };
}

} // namespace

std::vector<SttApiProvider> default_stt_api_providers() {
    return {
        {.id = "openai", .label = "OpenAI", .base_url = "https://api.openai.com/v1"},
        {.id = "groq", .label = "Groq", .base_url = "https://api.groq.com/openai/v1"},
        {.id = kCustomProviderId, .label = "Custom", .base_url = "http://localhost:8000/v1",
         .allow_base_url_edit = true},
    };
}

const SttApiProvider* SttApiSettings::find_provider(const std::string& id) const {
    for (auto& p : providers) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

SttApiProvider* SttApiSettings::find_provider(const std::string& id) {
    for (auto& p : providers) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

std::expected<Settings, std::string> Settings::read(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path);
    }

    Settings settings;
    try {
        auto j = json::parse(f);

        if (j.contains("stt_api")) apply_stt_api(j["stt_api"], settings.stt_api);
        if (j.contains("selected_language")) {
            settings.selected_language = j["selected_language"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("parse error in ") + path + ": " + e.what());
    }

    normalize_providers(settings.stt_api);
    return settings;
}

Settings Settings::load(const std::string& path) {
    auto settings = read(path);
    if (!settings) {
        std::println(stderr, "settings: {}, using defaults", settings.error());
        return Settings{};
    }
    return *std::move(settings);
}

std::expected<void, std::string> Settings::save(const std::string& path) const {
    json j = {
        {"selected_language", selected_language},
        {"stt_api", to_json(stt_api)},
    };

    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return std::unexpected("cannot create " + target.parent_path().string() + ": " +
                                   ec.message());
        }
    }

    // Write beside the target and rename so readers never see a partial file.
    auto tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected("cannot write " + tmp.string());
        }
        out << j.dump(2) << '\n';
        if (!out.flush()) {
            return std::unexpected("write failed: " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        auto msg = "cannot replace " + path + ": " + ec.message();
        fs::remove(tmp, ec);
        return std::unexpected(msg);
    }
    return {};
}

std::string Settings::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "settings.json").string();
}

SettingsStore::SettingsStore(std::string path) : path_(std::move(path)) {}

Settings SettingsStore::get() const {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    if (!fs::exists(path_, ec)) return Settings{};
    return Settings::load(path_);
}

std::expected<void, std::string> SettingsStore::write(const Settings& settings) {
    std::lock_guard lock(mutex_);
    return settings.save(path_);
}

std::expected<void, std::string> SettingsStore::update(const Mutation& mutate) {
    std::lock_guard lock(mutex_);

    Settings settings;
    std::error_code ec;
    bool exists = fs::exists(path_, ec);
    if (ec) {
        return std::unexpected("cannot stat " + path_ + ": " + ec.message());
    }
    if (exists) {
        auto current = Settings::read(path_);
        if (!current) {
            return std::unexpected("settings file is unreadable (" + current.error() +
                                   "), refusing to overwrite it");
        }
        settings = *std::move(current);
    }

    if (auto res = mutate(settings); !res) {
        return res;
    }
    return settings.save(path_);
}
