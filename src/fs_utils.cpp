#include "fs_utils.hpp"
#include "logger.hpp"
#include <cstdio>

namespace fs = std::filesystem;

namespace savekeeper {
namespace fsutil {

bool safe_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool safe_definitely_missing(const fs::path& path) {
    std::error_code ec;
    fs::file_status st = fs::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return false;  // unknown state
    }
    return st.type() == fs::file_type::not_found;
}

bool safe_is_directory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool safe_is_regular_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool copy_tree(const fs::path& src, const fs::path& dst, std::string& error) {
    std::error_code ec;

    if (!fs::is_directory(src, ec)) {
        error = "source is not a directory: " + src.string();
        return false;
    }

    if (!fs::create_directory(dst, ec)) {
        error = "cannot create " + dst.string() + ": " + (ec ? ec.message() : "already exists");
        return false;
    }

    fs::recursive_directory_iterator it(src, fs::directory_options::none, ec);
    if (ec) {
        error = "cannot read " + src.string() + ": " + ec.message();
        return false;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            error = "cannot traverse " + src.string() + ": " + ec.message();
            return false;
        }

        const fs::path& from = it->path();
        fs::path to = dst / from.lexically_relative(src);

        fs::file_status st = it->symlink_status(ec);
        if (ec) {
            error = "cannot stat " + from.string() + ": " + ec.message();
            return false;
        }

        if (fs::is_symlink(st)) {
            fs::copy_symlink(from, to, ec);
        } else if (fs::is_directory(st)) {
            fs::create_directory(to, from, ec);
        } else if (fs::is_regular_file(st)) {
            fs::copy_file(from, to, fs::copy_options::none, ec);
        } else {
            Logger::debug("[fsutil] Skipping special file: " + from.string());
            continue;
        }

        if (ec) {
            error = "cannot copy " + from.string() + ": " + ec.message();
            return false;
        }
    }

    return true;
}

uint64_t tree_size(const fs::path& path) {
    std::error_code ec;
    if (fs::is_regular_file(fs::symlink_status(path, ec))) {
        uintmax_t size = fs::file_size(path, ec);
        return ec ? 0 : static_cast<uint64_t>(size);
    }

    uint64_t total = 0;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) return 0;

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec)) {
            uintmax_t size = it->file_size(entry_ec);
            if (!entry_ec) total += static_cast<uint64_t>(size);
        }
    }
    return total;
}

bool remove_tree(const fs::path& path, std::string& error) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        error = "cannot remove " + path.string() + ": " + ec.message();
        return false;
    }
    return true;
}

std::string format_file_size(uint64_t size) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(size);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }

    char buffer[32];
    if (unit == 0) {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(size));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
    }
    return buffer;
}

} // namespace fsutil
} // namespace savekeeper
