#ifndef SAVEKEEPER_SNAPSHOT_CATALOG_HPP
#define SAVEKEEPER_SNAPSHOT_CATALOG_HPP

#include <string>
#include <vector>
#include <optional>
#include "snapshot.hpp"

namespace savekeeper {

/**
 * SnapshotCatalog - SQLite metadata for one entity's snapshots
 *
 * Lives at {backup_root}/{entity}/.catalog.db. A row is inserted with
 * complete = 0 before an artifact is staged and flipped to 1 once the
 * artifact has its final name, so a crash in between is detectable.
 *
 * A catalog object is a single connection and is not shared between
 * threads; the engine opens one per operation.
 */
class SnapshotCatalog {
public:
    SnapshotCatalog(std::string entity_id, std::string db_path);
    ~SnapshotCatalog();

    SnapshotCatalog(const SnapshotCatalog&) = delete;
    SnapshotCatalog& operator=(const SnapshotCatalog&) = delete;

    // Opens (creating if needed) and ensures the schema
    bool open();
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert_pending(const Snapshot& snapshot);
    bool insert_complete(const Snapshot& snapshot);
    bool mark_complete(const std::string& id, uint64_t size_bytes, const std::string& digest);
    bool remove(const std::string& id);

    // All rows, oldest first
    std::vector<Snapshot> load_all();
    std::optional<Snapshot> find(const std::string& id);

    const std::string& last_error() const { return last_error_; }
    const std::string& path() const { return db_path_; }

private:
    bool create_tables();
    bool insert(const Snapshot& snapshot);
    bool exec(const char* sql);

    std::string entity_id_;
    std::string db_path_;
    void* db_ = nullptr;  // sqlite3*
    std::string last_error_;
};

} // namespace savekeeper

#endif // SAVEKEEPER_SNAPSHOT_CATALOG_HPP
