#include "settings.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <algorithm>
#include <filesystem>

namespace savekeeper {

static std::string home_dir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string();
}

// Values are stored unescaped in memory; only '"' and '\' need escaping on disk
static std::string escape_json(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string SettingsManager::default_config_dir() {
    std::string home = home_dir();
    if (home.empty()) return "";
    return home + "/.config/savekeeper";
}

std::string SettingsManager::default_backup_root() {
    std::string home = home_dir();
    if (home.empty()) return "/tmp/savekeeper-backups";
    return home + "/.local/share/savekeeper/backups";
}

std::string SettingsManager::default_log_file() {
    std::string home = home_dir();
    if (home.empty()) return "";
    return home + "/.cache/savekeeper/savekeeper.log";
}

SettingsManager::SettingsManager() {
    std::string dir = default_config_dir();
    if (!dir.empty()) {
        config_path_ = dir + "/settings.json";
    }
}

SettingsManager::SettingsManager(const std::string& config_path)
    : config_path_(config_path) {
}

SettingsManager& SettingsManager::getInstance() {
    static SettingsManager instance;
    return instance;
}

std::string SettingsManager::get_config_dir() const {
    if (config_path_.empty()) return default_config_dir();
    return std::filesystem::path(config_path_).parent_path().string();
}

void SettingsManager::ensure_defaults() {
    // Set default values if not present
    if (settings_.find("backup_root") == settings_.end())
        settings_["backup_root"] = default_backup_root();
    if (settings_.find("default_retention") == settings_.end())
        settings_["default_retention"] = "50";
    if (settings_.find("default_debounce_seconds") == settings_.end())
        settings_["default_debounce_seconds"] = "3";
    if (settings_.find("compress_backups") == settings_.end())
        settings_["compress_backups"] = "false";
    if (settings_.find("safety_retention") == settings_.end())
        settings_["safety_retention"] = "5";
    if (settings_.find("manual_wait_seconds") == settings_.end())
        settings_["manual_wait_seconds"] = "30";
    if (settings_.find("worker_threads") == settings_.end())
        settings_["worker_threads"] = "2";

    // Watch retry policy
    if (settings_.find("watch_retry_limit") == settings_.end())
        settings_["watch_retry_limit"] = "5";
    if (settings_.find("watch_retry_base_ms") == settings_.end())
        settings_["watch_retry_base_ms"] = "1000";
    if (settings_.find("watch_retry_max_ms") == settings_.end())
        settings_["watch_retry_max_ms"] = "60000";

    if (settings_.find("show_notifications") == settings_.end())
        settings_["show_notifications"] = "true";
    if (settings_.find("debug_logging") == settings_.end())
        settings_["debug_logging"] = "false";
    if (settings_.find("log_file") == settings_.end())
        settings_["log_file"] = default_log_file();
}

bool SettingsManager::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_path_.empty()) {
        Logger::error("[Settings] No config path set");
        ensure_defaults();
        loaded_ = true;
        return false;
    }

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        Logger::info("[Settings] No settings file found at " + config_path_ + ", using defaults");
        ensure_defaults();
        loaded_ = true;
        return false;
    }

    std::string line;
    std::string content;
    while (std::getline(file, line)) {
        content += line;
        content += '\n';
    }
    file.close();

    // Flat JSON object: {"key": "value", "key": 12, "key": true}
    size_t pos = content.find('{');
    if (pos == std::string::npos) {
        Logger::warn("[Settings] Malformed settings file, using defaults");
        ensure_defaults();
        loaded_ = true;
        return false;
    }

    while ((pos = content.find('"', pos)) != std::string::npos) {
        size_t key_start = pos + 1;
        size_t key_end = content.find('"', key_start);
        if (key_end == std::string::npos) break;

        std::string key = content.substr(key_start, key_end - key_start);

        size_t colon = content.find(':', key_end);
        if (colon == std::string::npos) break;

        size_t val_start = content.find_first_not_of(" \t\r\n", colon + 1);
        if (val_start == std::string::npos) break;

        std::string value;
        if (content[val_start] == '"') {
            size_t i = val_start + 1;
            while (i < content.size() && content[i] != '"') {
                if (content[i] == '\\' && i + 1 < content.size()) {
                    ++i;
                }
                value += content[i];
                ++i;
            }
            if (i >= content.size()) break;
            pos = i + 1;
        } else {
            size_t val_end = content.find_first_of(",}\n", val_start);
            if (val_end == std::string::npos) val_end = content.length();
            value = content.substr(val_start, val_end - val_start);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.pop_back();
            }
            pos = val_end;
        }

        settings_[key] = value;
    }

    ensure_defaults();
    loaded_ = true;
    Logger::info("[Settings] Loaded " + std::to_string(settings_.size()) + " settings from " + config_path_);
    return true;
}

bool SettingsManager::save() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_path_.empty()) {
        Logger::error("[Settings] No config path set");
        return false;
    }

    std::error_code ec;
    std::filesystem::path dir = std::filesystem::path(config_path_).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::error("[Settings] Cannot create config directory " + dir.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(config_path_);
    if (!file.is_open()) {
        Logger::error("[Settings] Failed to open settings file for writing");
        return false;
    }

    file << "{\n";
    bool first = true;
    for (const auto& [key, value] : settings_) {
        if (!first) file << ",\n";
        first = false;

        bool is_numeric = !value.empty() &&
            std::all_of(value.begin(), value.end(), [](unsigned char c) {
                return std::isdigit(c) || c == '-';
            });
        bool is_bool = (value == "true" || value == "false");

        if (is_numeric || is_bool) {
            file << "  \"" << key << "\": " << value;
        } else {
            file << "  \"" << key << "\": \"" << escape_json(value) << "\"";
        }
    }
    file << "\n}\n";
    file.close();

    if (!file) {
        Logger::error("[Settings] Failed while writing " + config_path_);
        return false;
    }

    Logger::info("[Settings] Saved " + std::to_string(settings_.size()) + " settings");
    return true;
}

void SettingsManager::notify_change(const std::string& key) {
    SettingsChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = change_callback_;
    }
    if (callback) {
        callback(key);
    }
}

void SettingsManager::set_change_callback(SettingsChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callback_ = std::move(callback);
}

// Backup defaults
std::string SettingsManager::get_backup_root() const {
    return get_string("backup_root", default_backup_root());
}

void SettingsManager::set_backup_root(const std::string& path) {
    set_string("backup_root", path);
}

int SettingsManager::get_default_retention() const {
    return std::max(1, get_int("default_retention", 50));
}

void SettingsManager::set_default_retention(int count) {
    set_int("default_retention", std::max(1, count));
}

int SettingsManager::get_default_debounce_seconds() const {
    return std::max(1, get_int("default_debounce_seconds", 3));
}

void SettingsManager::set_default_debounce_seconds(int seconds) {
    set_int("default_debounce_seconds", std::max(1, seconds));
}

bool SettingsManager::get_compress_backups() const {
    return get_bool("compress_backups", false);
}

void SettingsManager::set_compress_backups(bool enabled) {
    set_bool("compress_backups", enabled);
}

int SettingsManager::get_safety_retention() const {
    return std::max(1, get_int("safety_retention", 5));
}

void SettingsManager::set_safety_retention(int count) {
    set_int("safety_retention", std::max(1, count));
}

// Concurrency
int SettingsManager::get_manual_wait_seconds() const {
    return std::max(0, get_int("manual_wait_seconds", 30));
}

int SettingsManager::get_worker_threads() const {
    return std::max(1, std::min(16, get_int("worker_threads", 2)));
}

// Watch retry policy
int SettingsManager::get_watch_retry_limit() const {
    return std::max(0, get_int("watch_retry_limit", 5));
}

int SettingsManager::get_watch_retry_base_ms() const {
    return std::max(10, get_int("watch_retry_base_ms", 1000));
}

int SettingsManager::get_watch_retry_max_ms() const {
    return std::max(get_watch_retry_base_ms(), get_int("watch_retry_max_ms", 60000));
}

// Notifications / logging
bool SettingsManager::get_show_notifications() const {
    return get_bool("show_notifications", true);
}

void SettingsManager::set_show_notifications(bool enabled) {
    set_bool("show_notifications", enabled);
}

bool SettingsManager::get_debug_logging() const {
    return get_bool("debug_logging", false);
}

void SettingsManager::set_debug_logging(bool enabled) {
    set_bool("debug_logging", enabled);
}

std::string SettingsManager::get_log_file() const {
    return get_string("log_file", default_log_file());
}

// Generic accessors
std::string SettingsManager::get_string(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(key);
    if (it != settings_.end()) {
        return it->second;
    }
    return default_value;
}

void SettingsManager::set_string(const std::string& key, const std::string& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }
    notify_change(key);
}

int SettingsManager::get_int(const std::string& key, int default_value) const {
    std::string str = get_string(key, "");
    if (str.empty()) return default_value;
    try {
        return std::stoi(str);
    } catch (const std::exception&) {
        Logger::warn("[Settings] Invalid integer for " + key + ": " + str);
        return default_value;
    }
}

void SettingsManager::set_int(const std::string& key, int value) {
    set_string(key, std::to_string(value));
}

bool SettingsManager::get_bool(const std::string& key, bool default_value) const {
    std::string str = get_string(key, "");
    if (str.empty()) return default_value;
    return (str == "true" || str == "1" || str == "yes");
}

void SettingsManager::set_bool(const std::string& key, bool value) {
    set_string(key, value ? "true" : "false");
}

} // namespace savekeeper
