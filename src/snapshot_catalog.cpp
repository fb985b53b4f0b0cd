#include "snapshot_catalog.hpp"
#include "logger.hpp"
#include <chrono>
#include <sqlite3.h>

namespace savekeeper {

SnapshotCatalog::SnapshotCatalog(std::string entity_id, std::string db_path)
    : entity_id_(std::move(entity_id)), db_path_(std::move(db_path)) {
}

SnapshotCatalog::~SnapshotCatalog() {
    close();
}

bool SnapshotCatalog::open() {
    if (db_) return true;

    sqlite3* db = nullptr;
    int rc = sqlite3_open(db_path_.c_str(), &db);
    if (rc != SQLITE_OK) {
        last_error_ = db ? sqlite3_errmsg(db) : "out of memory";
        Logger::error("[SnapshotCatalog] Failed to open " + db_path_ + ": " + last_error_);
        sqlite3_close(db);
        return false;
    }
    db_ = db;

    // Readers (listing) and the locked writer may overlap across threads
    sqlite3_busy_timeout(db, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");

    if (!create_tables()) {
        close();
        return false;
    }
    return true;
}

void SnapshotCatalog::close() {
    if (db_) {
        sqlite3_close(static_cast<sqlite3*>(db_));
        db_ = nullptr;
    }
}

bool SnapshotCatalog::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(static_cast<sqlite3*>(db_), sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        last_error_ = err ? err : "unknown error";
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool SnapshotCatalog::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS snapshots (
            id TEXT PRIMARY KEY,
            kind TEXT NOT NULL,
            format TEXT NOT NULL,
            created_us INTEGER NOT NULL,
            location TEXT NOT NULL,
            size_bytes INTEGER DEFAULT 0,
            digest TEXT DEFAULT '',
            complete INTEGER DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_snapshots_kind ON snapshots(kind);
    )";

    if (!exec(sql)) {
        Logger::error("[SnapshotCatalog] Failed to create tables: " + last_error_);
        return false;
    }
    return true;
}

bool SnapshotCatalog::insert(const Snapshot& snapshot) {
    if (!db_) {
        last_error_ = "catalog not open";
        return false;
    }
    sqlite3* db = static_cast<sqlite3*>(db_);

    const char* sql = R"(
        INSERT OR REPLACE INTO snapshots
            (id, kind, format, created_us, location, size_bytes, digest, complete)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db);
        Logger::error("[SnapshotCatalog] Insert prepare failed: " + last_error_);
        return false;
    }

    std::string kind = to_string(snapshot.kind);
    std::string format = to_string(snapshot.format);
    sqlite3_bind_text(stmt, 1, snapshot.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, kind.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, format.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, snapshot.timestamp.time_since_epoch().count());
    sqlite3_bind_text(stmt, 5, snapshot.location.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(snapshot.size_bytes));
    sqlite3_bind_text(stmt, 7, snapshot.digest.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 8, snapshot.complete ? 1 : 0);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db);
        Logger::error("[SnapshotCatalog] Insert failed for " + snapshot.id + ": " + last_error_);
        return false;
    }
    return true;
}

bool SnapshotCatalog::insert_pending(const Snapshot& snapshot) {
    Snapshot pending = snapshot;
    pending.complete = false;
    return insert(pending);
}

bool SnapshotCatalog::insert_complete(const Snapshot& snapshot) {
    Snapshot done = snapshot;
    done.complete = true;
    return insert(done);
}

bool SnapshotCatalog::mark_complete(const std::string& id, uint64_t size_bytes, const std::string& digest) {
    if (!db_) {
        last_error_ = "catalog not open";
        return false;
    }
    sqlite3* db = static_cast<sqlite3*>(db_);

    // complete = 0 in the WHERE clause keeps finished rows immutable
    const char* sql = "UPDATE snapshots SET complete = 1, size_bytes = ?, digest = ? "
                      "WHERE id = ? AND complete = 0";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db);
        return false;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(size_bytes));
    sqlite3_bind_text(stmt, 2, digest.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db);
        Logger::error("[SnapshotCatalog] Failed to complete " + id + ": " + last_error_);
        return false;
    }
    if (sqlite3_changes(db) != 1) {
        last_error_ = "no pending row for " + id;
        return false;
    }
    return true;
}

bool SnapshotCatalog::remove(const std::string& id) {
    if (!db_) {
        last_error_ = "catalog not open";
        return false;
    }
    sqlite3* db = static_cast<sqlite3*>(db_);

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, "DELETE FROM snapshots WHERE id = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db);
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db);
        Logger::error("[SnapshotCatalog] Failed to remove " + id + ": " + last_error_);
        return false;
    }
    return true;
}

static Snapshot read_row(sqlite3_stmt* stmt, const std::string& entity_id) {
    auto text = [stmt](int col) {
        const unsigned char* value = sqlite3_column_text(stmt, col);
        return value ? std::string(reinterpret_cast<const char*>(value)) : std::string();
    };

    Snapshot s;
    s.entity_id = entity_id;
    s.id = text(0);
    s.kind = parse_snapshot_kind(text(1)).value_or(SnapshotKind::Automatic);
    s.format = parse_snapshot_format(text(2)).value_or(SnapshotFormat::Directory);
    s.timestamp = SnapshotTime(std::chrono::microseconds(sqlite3_column_int64(stmt, 3)));
    s.location = text(4);
    s.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    s.digest = text(6);
    s.complete = sqlite3_column_int(stmt, 7) != 0;
    return s;
}

std::vector<Snapshot> SnapshotCatalog::load_all() {
    std::vector<Snapshot> result;
    if (!db_) {
        last_error_ = "catalog not open";
        return result;
    }
    sqlite3* db = static_cast<sqlite3*>(db_);

    const char* sql = R"(
        SELECT id, kind, format, created_us, location, size_bytes, digest, complete
        FROM snapshots
        ORDER BY id ASC
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db);
        Logger::error("[SnapshotCatalog] Load prepare failed: " + last_error_);
        return result;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(read_row(stmt, entity_id_));
    }
    sqlite3_finalize(stmt);
    return result;
}

std::optional<Snapshot> SnapshotCatalog::find(const std::string& id) {
    if (!db_) {
        last_error_ = "catalog not open";
        return std::nullopt;
    }
    sqlite3* db = static_cast<sqlite3*>(db_);

    const char* sql = R"(
        SELECT id, kind, format, created_us, location, size_bytes, digest, complete
        FROM snapshots
        WHERE id = ?
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db);
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<Snapshot> found;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        found = read_row(stmt, entity_id_);
    }
    sqlite3_finalize(stmt);
    return found;
}

} // namespace savekeeper
