#include "digest.hpp"
#include "logger.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <fstream>
#include <vector>
#include <algorithm>
#include <memory>

namespace fs = std::filesystem;

namespace savekeeper {
namespace digest {

namespace {

using EvpContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpContext new_sha256_context() {
    EvpContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

bool update(EVP_MD_CTX* ctx, const void* data, size_t len) {
    return EVP_DigestUpdate(ctx, data, len) == 1;
}

bool update(EVP_MD_CTX* ctx, const std::string& text) {
    // Length prefix keeps adjacent fields from running into each other
    uint64_t len = text.size();
    return update(ctx, &len, sizeof(len)) && update(ctx, text.data(), text.size());
}

bool update_file(EVP_MD_CTX* ctx, const fs::path& path, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "cannot open " + path.string();
        return false;
    }

    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && !update(ctx, buffer.data(), static_cast<size_t>(got))) {
            error = "digest update failed";
            return false;
        }
    }
    if (file.bad()) {
        error = "read error on " + path.string();
        return false;
    }
    return true;
}

std::string finish(EVP_MD_CTX* ctx, std::string& error) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1) {
        error = "digest finalization failed";
        return "";
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out += hex[hash[i] >> 4];
        out += hex[hash[i] & 0x0f];
    }
    return out;
}

} // namespace

std::string sha256_file(const fs::path& path, std::string& error) {
    EvpContext ctx = new_sha256_context();
    if (!ctx) {
        error = "cannot create digest context";
        Logger::error("[Digest] EVP context creation failed");
        return "";
    }
    if (!update_file(ctx.get(), path, error)) {
        return "";
    }
    return finish(ctx.get(), error);
}

std::string sha256_tree(const fs::path& root, std::string& error) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        error = "not a directory: " + root.string();
        return "";
    }

    std::vector<fs::path> entries;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        error = "cannot read " + root.string() + ": " + ec.message();
        return "";
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            error = "cannot traverse " + root.string() + ": " + ec.message();
            return "";
        }
        entries.push_back(it->path().lexically_relative(root));
    }
    std::sort(entries.begin(), entries.end());

    EvpContext ctx = new_sha256_context();
    if (!ctx) {
        error = "cannot create digest context";
        Logger::error("[Digest] EVP context creation failed");
        return "";
    }

    for (const auto& rel : entries) {
        fs::path full = root / rel;
        fs::file_status st = fs::symlink_status(full, ec);
        if (ec) {
            error = "cannot stat " + full.string() + ": " + ec.message();
            return "";
        }

        if (fs::is_symlink(st)) {
            fs::path target = fs::read_symlink(full, ec);
            if (ec) {
                error = "cannot read link " + full.string() + ": " + ec.message();
                return "";
            }
            if (!update(ctx.get(), "L") || !update(ctx.get(), rel.generic_string()) ||
                !update(ctx.get(), target.generic_string())) {
                error = "digest update failed";
                return "";
            }
        } else if (fs::is_directory(st)) {
            if (!update(ctx.get(), "D") || !update(ctx.get(), rel.generic_string())) {
                error = "digest update failed";
                return "";
            }
        } else if (fs::is_regular_file(st)) {
            uint64_t size = fs::file_size(full, ec);
            if (ec) {
                error = "cannot stat " + full.string() + ": " + ec.message();
                return "";
            }
            if (!update(ctx.get(), "F") || !update(ctx.get(), rel.generic_string()) ||
                !update(ctx.get(), &size, sizeof(size))) {
                error = "digest update failed";
                return "";
            }
            if (!update_file(ctx.get(), full, error)) {
                return "";
            }
        }
        // Special files are never copied into snapshots, so they are not hashed either
    }

    return finish(ctx.get(), error);
}

std::string sha256_artifact(const fs::path& location, SnapshotFormat format, std::string& error) {
    if (format == SnapshotFormat::Archive) {
        return sha256_file(location, error);
    }
    return sha256_tree(location, error);
}

} // namespace digest
} // namespace savekeeper
