#include <gtest/gtest.h>
#include <memory>
#include <vector>
#include <chrono>
#include <atomic>
#include <mutex>
#include <thread>
#include "watch_session.hpp"
#include "test_helpers.hpp"

using namespace savekeeper;
using namespace savekeeper::testing_util;
namespace fs = std::filesystem;
using std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

class WatchSessionTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        profile_ = make_profile("game");
        profile_.debounce_window = milliseconds(300);
        source_ = profile_.source_path;
        fs::create_directories(source_);

        retry_.max_attempts = 50;
        retry_.base_delay = milliseconds(50);
        retry_.max_delay = milliseconds(100);
    }

    void TearDown() override {
        session_.reset();
        TempDirTest::TearDown();
    }

    WatchSession& make_session() {
        session_ = std::make_unique<WatchSession>(profile_, retry_);
        session_->set_trigger_callback([this](const std::string&) {
            std::lock_guard<std::mutex> lock(mutex_);
            triggers_++;
            last_trigger_ = Clock::now();
            std::error_code ec;
            if (fs::exists(source_ / "save.dat", ec)) {
                content_at_trigger_ = read_file(source_ / "save.dat");
            }
        });
        session_->set_state_callback([this](const std::string&, WatchState state, const std::string&,
                                            bool persistent) {
            std::lock_guard<std::mutex> lock(mutex_);
            states_.push_back(state);
            if (persistent) persistent_reported_ = true;
        });
        return *session_;
    }

    int triggers() {
        std::lock_guard<std::mutex> lock(mutex_);
        return triggers_;
    }

    EntityProfile profile_;
    RetryPolicy retry_;
    fs::path source_;
    std::unique_ptr<WatchSession> session_;

    std::mutex mutex_;
    int triggers_ = 0;
    Clock::time_point last_trigger_{};
    std::string content_at_trigger_;
    std::vector<WatchState> states_;
    bool persistent_reported_ = false;
};

TEST_F(WatchSessionTest, BurstOfWritesTriggersOnceWithFinalContent) {
    profile_.debounce_window = milliseconds(600);
    auto& session = make_session();
    ASSERT_TRUE(session.start());

    write_file(source_ / "save.dat", "v1");
    std::this_thread::sleep_for(milliseconds(150));
    write_file(source_ / "save.dat", "v2");
    std::this_thread::sleep_for(milliseconds(150));
    write_file(source_ / "save.dat", "v3");
    auto last_write = Clock::now();

    ASSERT_TRUE(wait_until([this] { return triggers() >= 1; }, milliseconds(3000)));
    std::this_thread::sleep_for(milliseconds(900));

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(triggers_, 1);
    EXPECT_EQ(content_at_trigger_, "v3");
    EXPECT_GE(last_trigger_ - last_write, milliseconds(500));
}

TEST_F(WatchSessionTest, DeletionsNeverTrigger) {
    write_file(source_ / "old.sav", "x");
    write_file(source_ / "chapter1/auto.sav", "y");

    auto& session = make_session();
    ASSERT_TRUE(session.start());

    fs::remove(source_ / "old.sav");
    fs::remove_all(source_ / "chapter1");

    std::this_thread::sleep_for(milliseconds(1000));
    EXPECT_EQ(triggers(), 0);
    EXPECT_FALSE(session.debounce_armed());
    EXPECT_EQ(session.state(), WatchState::Watching);
}

TEST_F(WatchSessionTest, ScratchFilesAreIgnored) {
    auto& session = make_session();
    ASSERT_TRUE(session.start());

    write_file(source_ / ".save.dat.swp", "editor");
    write_file(source_ / "save.dat~", "backup");
    write_file(source_ / "download.part", "partial");

    std::this_thread::sleep_for(milliseconds(800));
    EXPECT_EQ(triggers(), 0);
}

TEST_F(WatchSessionTest, NewSubdirectoriesAreWatched) {
    auto& session = make_session();
    ASSERT_TRUE(session.start());

    fs::create_directories(source_ / "slot2");
    ASSERT_TRUE(wait_until([this] { return triggers() == 1; }));

    write_file(source_ / "slot2/progress.sav", "chapter 3");
    EXPECT_TRUE(wait_until([this] { return triggers() == 2; }));
}

TEST_F(WatchSessionTest, StartAndStopAreIdempotent) {
    auto& session = make_session();
    EXPECT_EQ(session.state(), WatchState::Stopped);

    EXPECT_TRUE(session.start());
    EXPECT_TRUE(session.start());
    EXPECT_EQ(session.state(), WatchState::Watching);
    EXPECT_TRUE(session.is_running());

    session.stop();
    session.stop();
    EXPECT_EQ(session.state(), WatchState::Stopped);
    EXPECT_FALSE(session.is_running());

    write_file(source_ / "save.dat", "while stopped");
    std::this_thread::sleep_for(milliseconds(600));
    EXPECT_EQ(triggers(), 0);

    ASSERT_TRUE(session.start());
    write_file(source_ / "save.dat", "after restart");
    EXPECT_TRUE(wait_until([this] { return triggers() == 1; }));
}

TEST_F(WatchSessionTest, StopCancelsPendingDebounce) {
    auto& session = make_session();
    ASSERT_TRUE(session.start());

    write_file(source_ / "save.dat", "v1");
    ASSERT_TRUE(wait_until([&session] { return session.debounce_armed(); }, milliseconds(1000)));
    session.stop();

    std::this_thread::sleep_for(milliseconds(600));
    EXPECT_EQ(triggers(), 0);
}

TEST_F(WatchSessionTest, CancelDebounceDropsPendingTrigger) {
    profile_.debounce_window = milliseconds(500);
    auto& session = make_session();
    ASSERT_TRUE(session.start());

    write_file(source_ / "save.dat", "v1");
    ASSERT_TRUE(wait_until([&session] { return session.debounce_armed(); }, milliseconds(1000)));
    session.cancel_debounce();

    std::this_thread::sleep_for(milliseconds(900));
    EXPECT_EQ(triggers(), 0);
}

TEST_F(WatchSessionTest, PendingRetriggerStartsNewQuietPeriod) {
    auto& session = make_session();
    ASSERT_TRUE(session.start());

    session.mark_pending_retrigger();
    EXPECT_TRUE(session.pending_retrigger());
    session.on_operation_finished();
    EXPECT_FALSE(session.pending_retrigger());
    EXPECT_TRUE(session.debounce_armed());

    EXPECT_TRUE(wait_until([this] { return triggers() == 1; }, milliseconds(2000)));
}

TEST_F(WatchSessionTest, OperationFinishedWithoutPendingDoesNothing) {
    auto& session = make_session();
    ASSERT_TRUE(session.start());
    session.on_operation_finished();
    EXPECT_FALSE(session.debounce_armed());
}

TEST_F(WatchSessionTest, MissingSourceRetriesUntilItAppears) {
    fs::remove_all(source_);
    auto& session = make_session();

    EXPECT_FALSE(session.start());
    EXPECT_EQ(session.state(), WatchState::Error);
    EXPECT_TRUE(session.is_running());
    EXPECT_FALSE(session.last_error().empty());
    EXPECT_FALSE(session.persistent_failure());

    fs::create_directories(source_);
    ASSERT_TRUE(wait_until([&session] { return session.state() == WatchState::Watching; }));
    EXPECT_EQ(session.retry_count(), 0);

    // Anything may have changed while unwatched, so a backup follows recovery
    EXPECT_TRUE(wait_until([this] { return triggers() == 1; }));
}

TEST_F(WatchSessionTest, ExhaustedRetriesArePersistent) {
    retry_.max_attempts = 2;
    retry_.base_delay = milliseconds(20);
    retry_.max_delay = milliseconds(40);
    fs::remove_all(source_);

    auto& session = make_session();
    EXPECT_FALSE(session.start());

    ASSERT_TRUE(wait_until([&session] { return session.persistent_failure(); }, milliseconds(3000)));
    EXPECT_EQ(session.state(), WatchState::Error);
    EXPECT_EQ(session.retry_count(), 2);

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_TRUE(persistent_reported_);
}

TEST_F(WatchSessionTest, RemovedRootEntersErrorState) {
    retry_.base_delay = milliseconds(5000);
    retry_.max_delay = milliseconds(5000);
    auto& session = make_session();
    ASSERT_TRUE(session.start());

    fs::remove_all(source_);
    ASSERT_TRUE(wait_until([&session] { return session.state() == WatchState::Error; }));
    EXPECT_EQ(triggers(), 0);
    EXPECT_NE(session.last_error().find("removed"), std::string::npos);

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(states_.back(), WatchState::Error);
}

TEST(RetryPolicyTest, DelayDoublesUpToCap) {
    RetryPolicy policy;
    policy.base_delay = milliseconds(100);
    policy.max_delay = milliseconds(1000);
    EXPECT_EQ(policy.delay_for(0), milliseconds(100));
    EXPECT_EQ(policy.delay_for(1), milliseconds(200));
    EXPECT_EQ(policy.delay_for(3), milliseconds(800));
    EXPECT_EQ(policy.delay_for(4), milliseconds(1000));
    EXPECT_EQ(policy.delay_for(30), milliseconds(1000));
}
