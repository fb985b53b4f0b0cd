#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

namespace savekeeper {
namespace fsutil {

/**
 * Safe filesystem operations that never throw exceptions.
 * These wrappers use std::error_code to handle I/O errors gracefully.
 */

bool safe_exists(const std::filesystem::path& path);

/**
 * Returns true only if the path is confirmed not to exist.
 * Returns false if it exists OR if there was an I/O error (unknown state).
 */
bool safe_definitely_missing(const std::filesystem::path& path);

bool safe_is_directory(const std::filesystem::path& path);

bool safe_is_regular_file(const std::filesystem::path& path);

/**
 * Recursively copy a directory tree into dst (created, must not exist).
 * Regular files, directories and symlinks are copied; sockets, fifos and
 * device nodes are skipped. Returns false and fills error on the first
 * failure; dst may then hold a partial copy the caller must discard.
 */
bool copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst, std::string& error);

/**
 * Sum of regular file sizes under path (or the file size if path is a file).
 */
uint64_t tree_size(const std::filesystem::path& path);

/**
 * Remove a file or a whole tree. A missing path counts as success.
 */
bool remove_tree(const std::filesystem::path& path, std::string& error);

/**
 * Format file size for display ("1.5 MB")
 */
std::string format_file_size(uint64_t size);

} // namespace fsutil
} // namespace savekeeper
