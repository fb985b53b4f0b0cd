#include "entity_profile.hpp"
#include "settings.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <filesystem>
#include <cctype>

namespace fs = std::filesystem;

namespace savekeeper {

// ============ JSON helpers ============

static std::string escape_json(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

// Splits the top-level objects of an array: [ {...}, {...} ]
static std::vector<std::string> split_objects(const std::string& content) {
    std::vector<std::string> objects;
    int depth = 0;
    bool in_string = false;
    size_t start = std::string::npos;

    for (size_t i = 0; i < content.size(); i++) {
        char c = content[i];
        if (in_string) {
            if (c == '\\') {
                i++;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            if (depth == 0) start = i;
            depth++;
        } else if (c == '}') {
            depth--;
            if (depth == 0 && start != std::string::npos) {
                objects.push_back(content.substr(start, i - start + 1));
                start = std::string::npos;
            }
        }
    }
    return objects;
}

// Returns the raw text after "key": up to the next ',' or '}' (strings unquoted and unescaped)
static std::optional<std::string> extract_field(const std::string& object, const std::string& key) {
    std::string needle = "\"" + key + "\"";
    size_t pos = object.find(needle);
    if (pos == std::string::npos) return std::nullopt;

    size_t colon = object.find(':', pos + needle.size());
    if (colon == std::string::npos) return std::nullopt;

    size_t start = object.find_first_not_of(" \t\r\n", colon + 1);
    if (start == std::string::npos) return std::nullopt;

    if (object[start] == '"') {
        std::string value;
        size_t i = start + 1;
        while (i < object.size() && object[i] != '"') {
            if (object[i] == '\\' && i + 1 < object.size()) {
                i++;
            }
            value += object[i];
            i++;
        }
        return value;
    }

    size_t end = object.find_first_of(",}\n", start);
    if (end == std::string::npos) end = object.size();
    std::string value = object.substr(start, end - start);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

static std::optional<long long> to_number(const std::optional<std::string>& raw) {
    if (!raw || raw->empty()) return std::nullopt;
    try {
        size_t used = 0;
        long long value = std::stoll(*raw, &used);
        if (used != raw->size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============ CompressionMode ============

std::string to_string(CompressionMode mode) {
    return mode == CompressionMode::Archive ? "archive" : "directory";
}

std::optional<CompressionMode> parse_compression_mode(const std::string& value) {
    if (value == "directory" || value == "directory-copy" || value == "none") {
        return CompressionMode::DirectoryCopy;
    }
    if (value == "archive" || value == "zip" || value == "tar.gz") {
        return CompressionMode::Archive;
    }
    return std::nullopt;
}

// ============ EntityProfile ============

bool EntityProfile::isValid(std::string* reason) const {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (id.empty()) return fail("profile id is empty");
    if (id.find('/') != std::string::npos || id == "." || id == "..") {
        return fail("profile id '" + id + "' is not a valid directory name");
    }
    if (source_path.empty()) return fail("source path is empty");
    if (backup_root.empty()) return fail("backup root is empty");
    if (retention_limit < 1) return fail("retention limit must be at least 1");
    if (safety_retention < 1) return fail("safety retention must be at least 1");
    if (debounce_window.count() <= 0) return fail("debounce window must be positive");

    // Backups inside the watched tree would retrigger themselves forever
    fs::path source = fs::path(source_path).lexically_normal();
    fs::path root = fs::path(backup_root).lexically_normal();
    auto rel = root.lexically_relative(source);
    if (!rel.empty() && *rel.begin() != "..") {
        return fail("backup root must not be inside the source path");
    }
    return true;
}

std::string EntityProfile::toJson() const {
    std::stringstream ss;
    ss << "  {\n";
    ss << "    \"id\": \"" << escape_json(id) << "\",\n";
    ss << "    \"name\": \"" << escape_json(display_name) << "\",\n";
    ss << "    \"source_path\": \"" << escape_json(source_path) << "\",\n";
    ss << "    \"backup_root\": \"" << escape_json(backup_root) << "\",\n";
    ss << "    \"retention_limit\": " << retention_limit << ",\n";
    ss << "    \"safety_retention\": " << safety_retention << ",\n";
    ss << "    \"debounce_ms\": " << debounce_window.count() << ",\n";
    ss << "    \"compression\": \"" << to_string(compression) << "\",\n";
    ss << "    \"enabled\": " << (enabled ? "true" : "false") << "\n";
    ss << "  }";
    return ss.str();
}

std::optional<EntityProfile> EntityProfile::fromJson(const std::string& json,
                                                     const SettingsManager& defaults) {
    EntityProfile profile;

    auto id = extract_field(json, "id");
    auto source = extract_field(json, "source_path");
    if (!id || id->empty() || !source || source->empty()) {
        return std::nullopt;
    }
    profile.id = *id;
    profile.source_path = *source;
    profile.display_name = extract_field(json, "name").value_or(profile.id);

    auto root = extract_field(json, "backup_root");
    profile.backup_root = (root && !root->empty()) ? *root : defaults.get_backup_root();

    profile.retention_limit = static_cast<int>(
        to_number(extract_field(json, "retention_limit")).value_or(defaults.get_default_retention()));
    profile.safety_retention = static_cast<int>(
        to_number(extract_field(json, "safety_retention")).value_or(defaults.get_safety_retention()));

    if (auto ms = to_number(extract_field(json, "debounce_ms"))) {
        profile.debounce_window = std::chrono::milliseconds(*ms);
    } else {
        long long seconds = to_number(extract_field(json, "debounce_seconds"))
                                .value_or(defaults.get_default_debounce_seconds());
        profile.debounce_window = std::chrono::seconds(seconds);
    }

    profile.compression = defaults.get_compress_backups() ? CompressionMode::Archive
                                                          : CompressionMode::DirectoryCopy;
    if (auto mode = extract_field(json, "compression")) {
        auto parsed = parse_compression_mode(*mode);
        if (parsed) {
            profile.compression = *parsed;
        } else {
            Logger::warn("[ProfileRegistry] Unknown compression '" + *mode + "' for " + profile.id +
                         ", using default");
        }
    }

    if (auto enabled = extract_field(json, "enabled")) {
        profile.enabled = (*enabled == "true" || *enabled == "1");
    }

    return profile;
}

// ============ ProfileRegistry ============

ProfileRegistry::ProfileRegistry(std::string config_path)
    : config_path_(std::move(config_path)) {
}

std::string ProfileRegistry::defaultPath() {
    std::string dir = SettingsManager::default_config_dir();
    if (dir.empty()) return "profiles.json";
    return dir + "/profiles.json";
}

bool ProfileRegistry::loadProfiles(const SettingsManager& defaults) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        Logger::info("[ProfileRegistry] No profiles file at " + config_path_);
        profiles_.clear();
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    file.close();

    profiles_.clear();
    for (const auto& object : split_objects(content)) {
        auto profile = EntityProfile::fromJson(object, defaults);
        if (!profile) {
            Logger::warn("[ProfileRegistry] Skipping profile without id or source_path");
            continue;
        }

        std::string reason;
        if (!profile->isValid(&reason)) {
            Logger::warn("[ProfileRegistry] Skipping invalid profile " + profile->id + ": " + reason);
            continue;
        }

        bool duplicate = std::any_of(profiles_.begin(), profiles_.end(),
            [&profile](const EntityProfile& p) { return p.id == profile->id; });
        if (duplicate) {
            Logger::warn("[ProfileRegistry] Duplicate profile id " + profile->id + ", keeping the first");
            continue;
        }
        profiles_.push_back(*profile);
    }

    Logger::info("[ProfileRegistry] Loaded " + std::to_string(profiles_.size()) + " profiles");
    return true;
}

bool ProfileRegistry::saveProfiles() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::path dir = fs::path(config_path_).parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
    }

    // Write to a sibling temp file and rename, so a crash never leaves half a registry
    std::string tmp_path = config_path_ + ".tmp";
    std::ofstream file(tmp_path);
    if (!file.is_open()) {
        Logger::error("[ProfileRegistry] Failed to open " + tmp_path + " for writing");
        return false;
    }

    file << "[\n";
    for (size_t i = 0; i < profiles_.size(); i++) {
        file << profiles_[i].toJson();
        if (i < profiles_.size() - 1) file << ",";
        file << "\n";
    }
    file << "]\n";
    file.close();
    if (!file) {
        Logger::error("[ProfileRegistry] Failed while writing " + tmp_path);
        return false;
    }

    fs::rename(tmp_path, config_path_, ec);
    if (ec) {
        Logger::error("[ProfileRegistry] Failed to replace " + config_path_ + ": " + ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }

    Logger::info("[ProfileRegistry] Saved " + std::to_string(profiles_.size()) + " profiles");
    return true;
}

std::optional<EntityProfile> ProfileRegistry::getProfile(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& profile : profiles_) {
        if (profile.id == id) return profile;
    }
    return std::nullopt;
}

std::vector<EntityProfile> ProfileRegistry::getAllProfiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_;
}

void ProfileRegistry::upsertProfile(const EntityProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : profiles_) {
        if (existing.id == profile.id) {
            existing = profile;
            return;
        }
    }
    profiles_.push_back(profile);
}

bool ProfileRegistry::removeProfile(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove_if(profiles_.begin(), profiles_.end(),
        [&id](const EntityProfile& p) { return p.id == id; });
    if (it == profiles_.end()) return false;
    profiles_.erase(it, profiles_.end());
    return true;
}

} // namespace savekeeper
