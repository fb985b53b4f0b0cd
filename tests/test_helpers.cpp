#include "test_helpers.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <thread>
#include <atomic>
#include <algorithm>
#include <unistd.h>

namespace fs = std::filesystem;

namespace savekeeper {
namespace testing_util {

namespace {

class QuietLogs : public ::testing::Environment {
public:
    void SetUp() override { Logger::init(LogLevel::WARN); }
    void TearDown() override { Logger::shutdown(); }
};

const auto* quiet_logs = ::testing::AddGlobalTestEnvironment(new QuietLogs);

std::atomic<int> dir_counter{0};

} // namespace

void TempDirTest::SetUp() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = std::string(info->test_suite_name()) + "_" + info->name();
    std::replace(name.begin(), name.end(), '/', '_');

    root_ = fs::path(::testing::TempDir()) /
            ("savekeeper_" + name + "_" + std::to_string(getpid()) + "_" + std::to_string(dir_counter++));
    std::error_code ec;
    fs::remove_all(root_, ec);
    fs::create_directories(root_, ec);
    ASSERT_FALSE(ec) << ec.message();
}

void TempDirTest::TearDown() {
    std::error_code ec;
    fs::remove_all(root_, ec);
}

EntityProfile TempDirTest::make_profile(const std::string& id, int retention) const {
    EntityProfile profile;
    profile.id = id;
    profile.display_name = id;
    profile.source_path = (root_ / "saves" / id).string();
    profile.backup_root = (root_ / "backups").string();
    profile.retention_limit = retention;
    profile.safety_retention = 3;
    profile.debounce_window = std::chrono::milliseconds(200);
    return profile;
}

void write_file(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> list_files(const fs::path& root) {
    std::vector<std::string> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file()) {
            files.push_back(it->path().lexically_relative(root).string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

} // namespace testing_util
} // namespace savekeeper
