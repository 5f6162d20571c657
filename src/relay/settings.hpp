#pragma once

#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct SttApiProvider {
    std::string id;
    std::string label;
    std::string base_url;
    bool allow_base_url_edit = false;

    bool operator==(const SttApiProvider&) const = default;
};

// Built-in provider list. Only "custom" has an editable base URL.
std::vector<SttApiProvider> default_stt_api_providers();

struct SttApiSettings {
    bool enabled = false;
    std::string provider_id = "openai";
    std::vector<SttApiProvider> providers = default_stt_api_providers();
    std::map<std::string, std::string> api_keys;
    std::map<std::string, std::string> models;

    const SttApiProvider* find_provider(const std::string& id) const;
    SttApiProvider* find_provider(const std::string& id);
    const SttApiProvider* active_provider() const { return find_provider(provider_id); }
};

// Configuration snapshot. Copied by value into every operation that reads it.
struct Settings {
    SttApiSettings stt_api;
    std::string selected_language = "auto";

    // Strict read: fails if the file cannot be opened or does not parse.
    static std::expected<Settings, std::string> read(const std::string& path);
    // Lenient read: falls back to defaults with a diagnostic.
    static Settings load(const std::string& path);
    std::expected<void, std::string> save(const std::string& path) const;

    // $XDG_CONFIG_HOME/stt-relay/settings.json, empty if no home directory.
    static std::string default_path();
};

// File-backed settings. get() hands out a copy; write() replaces the file;
// update() runs load -> modify -> save under one lock.
class SettingsStore {
public:
    using Mutation = std::function<std::expected<void, std::string>(Settings&)>;

    explicit SettingsStore(std::string path);

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    Settings get() const;
    std::expected<void, std::string> write(const Settings& settings);

    // A missing file starts from defaults. An existing file that cannot be
    // read is never overwritten. Nothing is saved when `mutate` fails.
    std::expected<void, std::string> update(const Mutation& mutate);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
};
