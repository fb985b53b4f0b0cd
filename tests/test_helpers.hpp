#pragma once

#include <gtest/gtest.h>
#include <string>
#include <chrono>
#include <functional>
#include <vector>
#include <filesystem>
#include "entity_profile.hpp"

namespace savekeeper {
namespace testing_util {

/**
 * Gives each test a fresh directory under testing::TempDir(), removed afterwards
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override;
    void TearDown() override;

    std::filesystem::path path(const std::string& relative) const { return root_ / relative; }

    // source under {root}/saves/{id}, backups under {root}/backups
    EntityProfile make_profile(const std::string& id, int retention = 5) const;

    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content);
std::string read_file(const std::filesystem::path& path);

// Sorted relative paths of regular files under root
std::vector<std::string> list_files(const std::filesystem::path& root);

// Polls every 10ms until the condition holds or the timeout passes
bool wait_until(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

} // namespace testing_util
} // namespace savekeeper
