#include "archive_codec.hpp"
#include "logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>
#include <fstream>
#include <vector>
#include <algorithm>

namespace fs = std::filesystem;

namespace savekeeper {
namespace archive_codec {

namespace {

bool is_safe_entry_path(const std::string& name) {
    if (name.empty()) return false;
    fs::path p(name);
    if (p.is_absolute()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

bool write_entry_data(struct archive* a, const fs::path& file, std::string& error) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        error = "cannot open " + file.string();
        return false;
    }

    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0 && archive_write_data(a, buffer.data(), static_cast<size_t>(got)) < 0) {
            error = "write failed for " + file.string() + ": " + archive_message(a);
            return false;
        }
    }
    if (in.bad()) {
        error = "read error on " + file.string();
        return false;
    }
    return true;
}

} // namespace

bool write_tar_gz(const fs::path& source_dir, const fs::path& archive_path, std::string& error) {
    std::error_code ec;
    if (!fs::is_directory(source_dir, ec)) {
        error = "source is not a directory: " + source_dir.string();
        return false;
    }

    std::vector<fs::path> entries;
    fs::recursive_directory_iterator it(source_dir, fs::directory_options::none, ec);
    if (ec) {
        error = "cannot read " + source_dir.string() + ": " + ec.message();
        return false;
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            error = "cannot traverse " + source_dir.string() + ": " + ec.message();
            return false;
        }
        entries.push_back(it->path());
    }
    std::sort(entries.begin(), entries.end());

    struct archive* a = archive_write_new();
    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);

    if (archive_write_open_filename(a, archive_path.c_str()) != ARCHIVE_OK) {
        error = "cannot open archive for writing: " + archive_message(a);
        archive_write_free(a);
        return false;
    }

    bool success = true;
    for (const auto& path : entries) {
        struct stat st;
        if (lstat(path.c_str(), &st) != 0) {
            error = "cannot stat " + path.string();
            success = false;
            break;
        }
        if (!S_ISREG(st.st_mode) && !S_ISDIR(st.st_mode) && !S_ISLNK(st.st_mode)) {
            Logger::debug("[ArchiveCodec] Skipping special file: " + path.string());
            continue;
        }

        struct archive_entry* entry = archive_entry_new();
        archive_entry_copy_stat(entry, &st);
        archive_entry_set_pathname(entry, path.lexically_relative(source_dir).generic_string().c_str());

        if (S_ISLNK(st.st_mode)) {
            fs::path target = fs::read_symlink(path, ec);
            if (ec) {
                error = "cannot read link " + path.string() + ": " + ec.message();
                archive_entry_free(entry);
                success = false;
                break;
            }
            archive_entry_set_symlink(entry, target.c_str());
        }

        if (archive_write_header(a, entry) < ARCHIVE_WARN) {
            error = "cannot write header for " + path.string() + ": " + archive_message(a);
            archive_entry_free(entry);
            success = false;
            break;
        }

        if (S_ISREG(st.st_mode) && st.st_size > 0) {
            if (!write_entry_data(a, path, error)) {
                archive_entry_free(entry);
                success = false;
                break;
            }
        }
        archive_entry_free(entry);
    }

    if (archive_write_close(a) != ARCHIVE_OK && success) {
        error = "cannot finish archive: " + archive_message(a);
        success = false;
    }
    archive_write_free(a);
    return success;
}

bool extract_tar_gz(const fs::path& archive_path, const fs::path& target, std::string& error) {
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        error = "cannot create " + target.string() + ": " + ec.message();
        return false;
    }

    // Symlink checks apply to every component, so resolve the prefix first
    fs::path target_dir = fs::canonical(target, ec);
    if (ec) {
        error = "cannot resolve " + target.string() + ": " + ec.message();
        return false;
    }

    struct archive* a = archive_read_new();
    archive_read_support_filter_gzip(a);
    archive_read_support_format_tar(a);

    struct archive* ext = archive_write_disk_new();
    archive_write_disk_set_options(ext, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                        ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(ext);

    if (archive_read_open_filename(a, archive_path.c_str(), 10240) != ARCHIVE_OK) {
        error = "cannot open archive: " + archive_message(a);
        archive_read_free(a);
        archive_write_free(ext);
        return false;
    }

    bool success = true;
    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        std::string name = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        if (!is_safe_entry_path(name)) {
            error = "unsafe entry path in archive: " + name;
            success = false;
            break;
        }
        archive_entry_set_pathname(entry, (target_dir / name).c_str());

        const char* hardlink = archive_entry_hardlink(entry);
        if (hardlink) {
            if (!is_safe_entry_path(hardlink)) {
                error = std::string("unsafe hardlink in archive: ") + hardlink;
                success = false;
                break;
            }
            archive_entry_set_hardlink(entry, (target_dir / hardlink).c_str());
        }

        if (archive_write_header(ext, entry) < ARCHIVE_WARN) {
            error = "extract header error: " + archive_message(ext);
            success = false;
            break;
        }

        if (archive_entry_size(entry) > 0) {
            const void* buff;
            size_t size;
            la_int64_t offset;
            int rb;
            while ((rb = archive_read_data_block(a, &buff, &size, &offset)) == ARCHIVE_OK) {
                if (archive_write_data_block(ext, buff, size, offset) < ARCHIVE_WARN) {
                    error = "extract write error: " + archive_message(ext);
                    success = false;
                    break;
                }
            }
            if (success && rb != ARCHIVE_EOF) {
                error = "archive read error: " + archive_message(a);
                success = false;
            }
        }
        if (archive_write_finish_entry(ext) < ARCHIVE_WARN && success) {
            error = "extract finish error: " + archive_message(ext);
            success = false;
        }

        if (!success) break;
    }

    if (success && r != ARCHIVE_EOF) {
        error = "archive read error: " + archive_message(a);
        success = false;
    }

    archive_read_free(a);
    archive_write_free(ext);
    return success;
}

bool verify_readable(const fs::path& archive_path, std::string& error) {
    struct archive* a = archive_read_new();
    archive_read_support_filter_gzip(a);
    archive_read_support_format_tar(a);

    if (archive_read_open_filename(a, archive_path.c_str(), 10240) != ARCHIVE_OK) {
        error = "cannot open archive: " + archive_message(a);
        archive_read_free(a);
        return false;
    }

    bool success = true;
    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        if (archive_read_data_skip(a) != ARCHIVE_OK) {
            error = "archive read error: " + archive_message(a);
            success = false;
            break;
        }
    }
    if (success && r != ARCHIVE_EOF) {
        error = "archive read error: " + archive_message(a);
        success = false;
    }

    archive_read_free(a);
    return success;
}

} // namespace archive_codec
} // namespace savekeeper
