#include <gtest/gtest.h>
#include <vector>
#include <chrono>
#include <algorithm>
#include "snapshot_engine.hpp"
#include "archive_codec.hpp"
#include "test_helpers.hpp"

using namespace savekeeper;
using namespace savekeeper::testing_util;
namespace fs = std::filesystem;

class SnapshotEngineTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        profile_ = make_profile("game", 3);
        write_file(fs::path(profile_.source_path) / "slot1.sav", "level 1");
        write_file(fs::path(profile_.source_path) / "profiles/main.cfg", "volume=7");
    }

    std::vector<std::string> ids(const std::vector<Snapshot>& snapshots, bool safety) const {
        std::vector<std::string> out;
        for (const auto& s : snapshots) {
            if ((s.kind == SnapshotKind::Safety) == safety) out.push_back(s.id);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    SnapshotResult create(SnapshotKind kind = SnapshotKind::Automatic) {
        return engine_.create(profile_, kind);
    }

    EntityLockTable locks_;
    SnapshotEngine engine_{locks_};
    EntityProfile profile_;
};

TEST_F(SnapshotEngineTest, DirectorySnapshotMirrorsSource) {
    auto result = create();
    ASSERT_TRUE(result.ok()) << result.error;
    const Snapshot& s = *result.snapshot;

    EXPECT_EQ(s.format, SnapshotFormat::Directory);
    EXPECT_TRUE(s.complete);
    EXPECT_EQ(s.location, (SnapshotEngine::entity_dir(profile_) / s.id).string());
    EXPECT_GT(s.size_bytes, 0u);
    EXPECT_EQ(s.digest.size(), 64u);

    EXPECT_EQ(list_files(s.location), (std::vector<std::string>{"profiles/main.cfg", "slot1.sav"}));
    EXPECT_EQ(read_file(fs::path(s.location) / "slot1.sav"), "level 1");

    std::string error;
    EXPECT_TRUE(engine_.verify(s, error)) << error;
}

TEST_F(SnapshotEngineTest, RetentionKeepsNewestSnapshots) {
    std::vector<std::string> created;
    for (int i = 1; i <= 5; i++) {
        write_file(fs::path(profile_.source_path) / "slot1.sav", "level " + std::to_string(i));
        auto result = create();
        ASSERT_TRUE(result.ok()) << result.error;
        created.push_back(result.snapshot->id);
    }

    auto remaining = ids(engine_.list(profile_), false);
    EXPECT_EQ(remaining, (std::vector<std::string>{created[2], created[3], created[4]}));

    for (int i = 0; i < 2; i++) {
        EXPECT_FALSE(fs::exists(SnapshotEngine::entity_dir(profile_) / created[i]));
    }
    auto newest = engine_.find(profile_, created[4]);
    ASSERT_TRUE(newest.has_value());
    EXPECT_EQ(read_file(fs::path(newest->location) / "slot1.sav"), "level 5");
}

TEST_F(SnapshotEngineTest, PruneReportsRemovedIds) {
    std::vector<std::string> created;
    for (int i = 0; i < 3; i++) {
        created.push_back(create().snapshot->id);
    }
    auto fourth = create();
    ASSERT_TRUE(fourth.ok());
    EXPECT_EQ(fourth.pruned, (std::vector<std::string>{created[0]}));
    EXPECT_TRUE(fourth.retention_warnings.empty());
}

TEST_F(SnapshotEngineTest, ManualSnapshotsCountTowardRetention) {
    auto first = create(SnapshotKind::Automatic);
    create(SnapshotKind::Manual);
    create(SnapshotKind::Manual);
    create(SnapshotKind::Automatic);
    ASSERT_TRUE(first.ok());

    auto listed = engine_.list(profile_);
    ASSERT_EQ(listed.size(), 3u);
    for (const auto& s : listed) {
        EXPECT_NE(s.id, first.snapshot->id);
    }
}

TEST_F(SnapshotEngineTest, ListIsNewestFirstWithStrictlyIncreasingIds) {
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(create().ok());
    }
    auto listed = engine_.list(profile_);
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_GT(listed[0].id, listed[1].id);
    EXPECT_GT(listed[1].id, listed[2].id);
    EXPECT_GT(listed[0].timestamp, listed[1].timestamp);
}

TEST_F(SnapshotEngineTest, SafetySnapshotsHaveTheirOwnLimit) {
    profile_.retention_limit = 2;
    profile_.safety_retention = 2;

    ASSERT_TRUE(create().ok());
    ASSERT_TRUE(create().ok());
    std::vector<std::string> safety;
    for (int i = 0; i < 3; i++) {
        auto result = create(SnapshotKind::Safety);
        ASSERT_TRUE(result.ok()) << result.error;
        EXPECT_EQ(fs::path(result.snapshot->location).parent_path(), SnapshotEngine::safety_dir(profile_));
        safety.push_back(result.snapshot->id);
    }

    auto listed = engine_.list(profile_);
    EXPECT_EQ(ids(listed, false).size(), 2u);
    EXPECT_EQ(ids(listed, true), (std::vector<std::string>{safety[1], safety[2]}));

    // Regular retention never touches safety snapshots
    ASSERT_TRUE(create().ok());
    EXPECT_EQ(ids(engine_.list(profile_), true).size(), 2u);
}

TEST_F(SnapshotEngineTest, ArchiveModeWritesTarGz) {
    profile_.compression = CompressionMode::Archive;
    auto result = create();
    ASSERT_TRUE(result.ok()) << result.error;
    const Snapshot& s = *result.snapshot;

    EXPECT_EQ(s.format, SnapshotFormat::Archive);
    EXPECT_EQ(fs::path(s.location).filename().string(), s.id + ".tar.gz");
    EXPECT_TRUE(fs::is_regular_file(s.location));

    std::string error;
    EXPECT_TRUE(engine_.verify(s, error)) << error;

    fs::path out = path("extracted");
    ASSERT_TRUE(engine_.materialize(s, out, error)) << error;
    EXPECT_EQ(list_files(out), (std::vector<std::string>{"profiles/main.cfg", "slot1.sav"}));
    EXPECT_EQ(read_file(out / "profiles/main.cfg"), "volume=7");
}

TEST_F(SnapshotEngineTest, ArchiveReplacedByDirectoryFailsVerify) {
    profile_.compression = CompressionMode::Archive;
    auto result = create();
    ASSERT_TRUE(result.ok()) << result.error;
    const Snapshot& s = *result.snapshot;

    fs::remove(s.location);
    write_file(fs::path(s.location) / "slot1.sav", "not an archive");

    std::string error;
    EXPECT_FALSE(engine_.verify(s, error));
    EXPECT_NE(error.find("not an archive file"), std::string::npos) << error;
}

TEST(ArchiveCodecTest, TruncatedArchiveIsUnreadable) {
    fs::path root = fs::path(testing::TempDir()) / "archive_codec_truncated";
    fs::remove_all(root);
    write_file(root / "src/slot1.sav", std::string(64 * 1024, 'x'));

    std::string error;
    fs::path archive = root / "out.tar.gz";
    ASSERT_TRUE(archive_codec::write_tar_gz(root / "src", archive, error)) << error;
    EXPECT_TRUE(archive_codec::verify_readable(archive, error)) << error;

    fs::resize_file(archive, fs::file_size(archive) / 2);
    EXPECT_FALSE(archive_codec::verify_readable(archive, error));
    EXPECT_FALSE(error.empty());
    fs::remove_all(root);
}

TEST_F(SnapshotEngineTest, MissingSourceFailsWithoutArtifacts) {
    fs::remove_all(profile_.source_path);

    auto result = create();
    EXPECT_EQ(result.status, SnapshotResult::Status::Failed);
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(result.snapshot.has_value());
    EXPECT_TRUE(engine_.list(profile_).empty());
}

TEST_F(SnapshotEngineTest, UnwritableBackupLocationFailsCleanly) {
    // A file where the entity directory should be
    write_file(SnapshotEngine::entity_dir(profile_), "not a directory");

    auto result = create();
    EXPECT_EQ(result.status, SnapshotResult::Status::Failed);
    EXPECT_TRUE(fs::is_regular_file(SnapshotEngine::entity_dir(profile_)));
    EXPECT_EQ(read_file(SnapshotEngine::entity_dir(profile_)), "not a directory");
}

TEST_F(SnapshotEngineTest, SourceDeletionLeavesSnapshotsAlone) {
    auto first = create();
    ASSERT_TRUE(first.ok());

    fs::remove(fs::path(profile_.source_path) / "slot1.sav");
    auto second = create();
    ASSERT_TRUE(second.ok());

    fs::remove_all(profile_.source_path);
    auto third = create();
    EXPECT_EQ(third.status, SnapshotResult::Status::Failed);

    auto listed = engine_.list(profile_);
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(read_file(fs::path(first.snapshot->location) / "slot1.sav"), "level 1");
    EXPECT_FALSE(fs::exists(fs::path(second.snapshot->location) / "slot1.sav"));
}

TEST_F(SnapshotEngineTest, BusyWhileEntityLocked) {
    auto guard = locks_.try_acquire(profile_.id);
    ASSERT_TRUE(guard);

    auto result = create();
    EXPECT_EQ(result.status, SnapshotResult::Status::Busy);

    auto waited = engine_.create(profile_, SnapshotKind::Manual, std::chrono::milliseconds(50));
    EXPECT_EQ(waited.status, SnapshotResult::Status::Busy);

    guard.release();
    EXPECT_TRUE(create().ok());
}

TEST_F(SnapshotEngineTest, VerifyDetectsTampering) {
    auto result = create();
    ASSERT_TRUE(result.ok());
    write_file(fs::path(result.snapshot->location) / "slot1.sav", "edited");

    std::string error;
    EXPECT_FALSE(engine_.verify(*result.snapshot, error));
    EXPECT_NE(error.find("corrupt"), std::string::npos);
}

TEST_F(SnapshotEngineTest, ReconcileCleansStagingAndDropsVanishedRows) {
    auto first = create();
    ASSERT_TRUE(first.ok());

    fs::path leftover = SnapshotEngine::entity_dir(profile_) / ".staging-20200101_000000_000000";
    write_file(leftover / "partial.sav", "half");
    fs::remove_all(first.snapshot->location);

    ASSERT_TRUE(create().ok());
    EXPECT_FALSE(fs::exists(leftover));
    EXPECT_FALSE(engine_.find(profile_, first.snapshot->id).has_value());
    EXPECT_EQ(engine_.list(profile_).size(), 1u);
}

TEST_F(SnapshotEngineTest, ReconcileAdoptsUncataloguedSnapshot) {
    auto first = create();
    ASSERT_TRUE(first.ok());

    // Copy left behind by an older catalog
    fs::path adopted = SnapshotEngine::entity_dir(profile_) / "20200101_000000_000000";
    write_file(adopted / "slot1.sav", "old save");

    ASSERT_TRUE(create().ok());
    auto found = engine_.find(profile_, "20200101_000000_000000");
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(found->complete);
    EXPECT_EQ(found->kind, SnapshotKind::Automatic);

    std::string error;
    EXPECT_TRUE(engine_.verify(*found, error)) << error;
}

TEST_F(SnapshotEngineTest, SafetySnapshotOfMissingSourceIsEmpty) {
    fs::remove_all(profile_.source_path);
    auto result = create(SnapshotKind::Safety);
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_TRUE(fs::is_directory(result.snapshot->location));
    EXPECT_TRUE(list_files(result.snapshot->location).empty());
}

TEST_F(SnapshotEngineTest, ProgressCallbackBracketsEachOperation) {
    std::vector<std::string> stages;
    engine_.set_progress_callback([&stages](const std::string& id, const std::string& stage) {
        stages.push_back(id + ":" + stage);
    });

    ASSERT_TRUE(create().ok());
    fs::remove_all(profile_.source_path);
    EXPECT_FALSE(create().ok());

    EXPECT_EQ(stages, (std::vector<std::string>{"game:begin", "game:end", "game:begin", "game:end"}));
}

TEST_F(SnapshotEngineTest, BackupSizeCoversAllSnapshots) {
    EXPECT_EQ(engine_.backup_size(profile_), 0u);
    auto result = create();
    ASSERT_TRUE(result.ok());
    EXPECT_GE(engine_.backup_size(profile_), result.snapshot->size_bytes);
}
