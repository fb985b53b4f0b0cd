#include <gtest/gtest.h>
#include <chrono>
#include "settings.hpp"
#include "entity_profile.hpp"
#include "test_helpers.hpp"

using namespace savekeeper;
using namespace savekeeper::testing_util;
using std::chrono::milliseconds;

class SettingsProfileTest : public TempDirTest {
protected:
    std::string settings_path() const { return path("config/settings.json").string(); }
    std::string profiles_path() const { return path("config/profiles.json").string(); }
};

TEST_F(SettingsProfileTest, MissingFileYieldsDefaults) {
    SettingsManager settings(settings_path());
    EXPECT_FALSE(settings.load());

    EXPECT_EQ(settings.get_default_retention(), 50);
    EXPECT_EQ(settings.get_default_debounce_seconds(), 3);
    EXPECT_EQ(settings.get_safety_retention(), 5);
    EXPECT_EQ(settings.get_manual_wait_seconds(), 30);
    EXPECT_EQ(settings.get_worker_threads(), 2);
    EXPECT_EQ(settings.get_watch_retry_limit(), 5);
    EXPECT_FALSE(settings.get_compress_backups());
    EXPECT_TRUE(settings.get_show_notifications());
    EXPECT_FALSE(settings.get_backup_root().empty());
    EXPECT_EQ(settings.get_config_dir(), path("config").string());
}

TEST_F(SettingsProfileTest, SaveAndReload) {
    {
        SettingsManager settings(settings_path());
        settings.load();
        settings.set_backup_root("/srv/backups/my \"saves\"");
        settings.set_default_retention(7);
        settings.set_compress_backups(true);
        settings.set_string("theme", "dark");
        ASSERT_TRUE(settings.save());
    }

    SettingsManager reloaded(settings_path());
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.get_backup_root(), "/srv/backups/my \"saves\"");
    EXPECT_EQ(reloaded.get_default_retention(), 7);
    EXPECT_TRUE(reloaded.get_compress_backups());
    EXPECT_EQ(reloaded.get_string("theme"), "dark");
}

TEST_F(SettingsProfileTest, OutOfRangeValuesAreClamped) {
    write_file(settings_path(),
               "{\n  \"default_retention\": 0,\n  \"worker_threads\": 99,\n  \"manual_wait_seconds\": -4,\n"
               "  \"default_debounce_seconds\": \"soon\"\n}\n");
    SettingsManager settings(settings_path());
    ASSERT_TRUE(settings.load());
    EXPECT_EQ(settings.get_default_retention(), 1);
    EXPECT_EQ(settings.get_worker_threads(), 16);
    EXPECT_EQ(settings.get_manual_wait_seconds(), 0);
    EXPECT_EQ(settings.get_default_debounce_seconds(), 3);
}

TEST_F(SettingsProfileTest, ChangeCallbackFires) {
    SettingsManager settings(settings_path());
    settings.load();
    std::string changed;
    settings.set_change_callback([&changed](const std::string& key) { changed = key; });
    settings.set_safety_retention(9);
    EXPECT_EQ(changed, "safety_retention");
}

TEST_F(SettingsProfileTest, ProfilesFallBackToSettingsDefaults) {
    SettingsManager settings(settings_path());
    settings.load();
    settings.set_backup_root(path("backups").string());
    settings.set_default_retention(12);
    settings.set_compress_backups(true);

    write_file(profiles_path(),
               "[\n"
               "  {\"id\": \"elden\", \"name\": \"Elden Ring\", \"source_path\": \"/games/elden/saves\"},\n"
               "  {\"id\": \"hades\", \"source_path\": \"/games/hades\", \"retention_limit\": 4,\n"
               "   \"debounce_ms\": 750, \"compression\": \"directory\", \"enabled\": false}\n"
               "]\n");

    ProfileRegistry registry(profiles_path());
    ASSERT_TRUE(registry.loadProfiles(settings));
    ASSERT_EQ(registry.getAllProfiles().size(), 2u);

    auto elden = registry.getProfile("elden");
    ASSERT_TRUE(elden.has_value());
    EXPECT_EQ(elden->display_name, "Elden Ring");
    EXPECT_EQ(elden->backup_root, path("backups").string());
    EXPECT_EQ(elden->retention_limit, 12);
    EXPECT_EQ(elden->debounce_window, milliseconds(3000));
    EXPECT_EQ(elden->compression, CompressionMode::Archive);
    EXPECT_TRUE(elden->enabled);

    auto hades = registry.getProfile("hades");
    ASSERT_TRUE(hades.has_value());
    EXPECT_EQ(hades->display_name, "hades");
    EXPECT_EQ(hades->retention_limit, 4);
    EXPECT_EQ(hades->debounce_window, milliseconds(750));
    EXPECT_EQ(hades->compression, CompressionMode::DirectoryCopy);
    EXPECT_FALSE(hades->enabled);
}

TEST_F(SettingsProfileTest, InvalidAndDuplicateProfilesAreSkipped) {
    SettingsManager settings(settings_path());
    settings.load();
    settings.set_backup_root(path("backups").string());

    write_file(profiles_path(),
               "[\n"
               "  {\"id\": \"a\", \"source_path\": \"/games/a\"},\n"
               "  {\"id\": \"a\", \"source_path\": \"/games/other\"},\n"
               "  {\"name\": \"no id\", \"source_path\": \"/games/b\"},\n"
               "  {\"id\": \"c\", \"source_path\": \"/games/c\", \"retention_limit\": 0},\n"
               "  {\"id\": \"d\", \"source_path\": \"/games/d\", \"backup_root\": \"/games/d/backups\"}\n"
               "]\n");

    ProfileRegistry registry(profiles_path());
    ASSERT_TRUE(registry.loadProfiles(settings));
    auto all = registry.getAllProfiles();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].source_path, "/games/a");
}

TEST_F(SettingsProfileTest, RegistryRoundTripsThroughDisk) {
    SettingsManager settings(settings_path());
    settings.load();

    ProfileRegistry registry(profiles_path());
    EXPECT_FALSE(registry.loadProfiles(settings));

    EntityProfile profile = make_profile("witcher", 8);
    profile.display_name = "The Witcher \"3\"";
    profile.compression = CompressionMode::Archive;
    registry.upsertProfile(profile);
    profile.retention_limit = 9;
    registry.upsertProfile(profile);
    ASSERT_TRUE(registry.saveProfiles());

    ProfileRegistry reloaded(profiles_path());
    ASSERT_TRUE(reloaded.loadProfiles(settings));
    auto loaded = reloaded.getProfile("witcher");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->display_name, "The Witcher \"3\"");
    EXPECT_EQ(loaded->retention_limit, 9);
    EXPECT_EQ(loaded->safety_retention, 3);
    EXPECT_EQ(loaded->debounce_window, milliseconds(200));
    EXPECT_EQ(loaded->compression, CompressionMode::Archive);
    EXPECT_EQ(loaded->source_path, profile.source_path);

    EXPECT_TRUE(reloaded.removeProfile("witcher"));
    EXPECT_FALSE(reloaded.removeProfile("witcher"));
    EXPECT_TRUE(reloaded.getAllProfiles().empty());
}

TEST(EntityProfileTest, ValidationMessages) {
    EntityProfile profile;
    profile.id = "game";
    profile.source_path = "/saves/game";
    profile.backup_root = "/backups";
    EXPECT_TRUE(profile.isValid());

    std::string reason;
    EntityProfile bad = profile;
    bad.id = "a/b";
    EXPECT_FALSE(bad.isValid(&reason));
    EXPECT_NE(reason.find("directory name"), std::string::npos);

    bad = profile;
    bad.debounce_window = milliseconds(0);
    EXPECT_FALSE(bad.isValid(&reason));

    bad = profile;
    bad.safety_retention = 0;
    EXPECT_FALSE(bad.isValid(&reason));

    bad = profile;
    bad.backup_root = "/saves/game/.backups";
    EXPECT_FALSE(bad.isValid(&reason));
    EXPECT_NE(reason.find("inside"), std::string::npos);
}

TEST(EntityProfileTest, CompressionModeNames) {
    EXPECT_EQ(parse_compression_mode("archive"), CompressionMode::Archive);
    EXPECT_EQ(parse_compression_mode("tar.gz"), CompressionMode::Archive);
    EXPECT_EQ(parse_compression_mode("directory"), CompressionMode::DirectoryCopy);
    EXPECT_FALSE(parse_compression_mode("rar").has_value());
    EXPECT_EQ(to_string(CompressionMode::Archive), "archive");
}
