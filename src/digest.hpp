#pragma once

#include <string>
#include <filesystem>
#include "snapshot.hpp"

namespace savekeeper {
namespace digest {

// SHA-256 helpers (OpenSSL EVP). All return lowercase hex, or "" on failure with error set.

std::string sha256_file(const std::filesystem::path& path, std::string& error);

/**
 * Content digest of a directory tree. Covers each entry's relative path
 * (sorted), its type, symlink targets and regular file contents, so two
 * trees hash equal only if a restore from either gives the same result.
 */
std::string sha256_tree(const std::filesystem::path& root, std::string& error);

// Digest of a snapshot artifact: file bytes for archives, tree digest for directories
std::string sha256_artifact(const std::filesystem::path& location, SnapshotFormat format,
                            std::string& error);

} // namespace digest
} // namespace savekeeper
