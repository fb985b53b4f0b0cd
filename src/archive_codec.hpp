#pragma once

#include <string>
#include <filesystem>

namespace savekeeper {
namespace archive_codec {

/**
 * gzip-compressed tar (pax restricted) via libarchive.
 *
 * Entry names are relative to the source directory, so extracting into
 * any target reproduces the tree directly under it. Regular files,
 * directories and symlinks are stored with their mode and mtime.
 */
bool write_tar_gz(const std::filesystem::path& source_dir,
                  const std::filesystem::path& archive_path,
                  std::string& error);

/**
 * Extract into target_dir (created if missing). Entries with absolute
 * paths or ".." components are rejected, as are writes through symlinks.
 */
bool extract_tar_gz(const std::filesystem::path& archive_path,
                    const std::filesystem::path& target_dir,
                    std::string& error);

// Reads every entry to the end; false if the archive is truncated or corrupt
bool verify_readable(const std::filesystem::path& archive_path, std::string& error);

} // namespace archive_codec
} // namespace savekeeper
