#pragma once

#include <string>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <unordered_set>

namespace savekeeper {

/**
 * EntityLockTable - one exclusive lock per entity id
 *
 * Snapshot creation, pruning and restore for an entity all run under its
 * lock, so at most one such operation touches an entity's backup tree at
 * a time. Locks for different entities are independent. The lock is not
 * recursive: acquiring it again on the thread that holds it fails.
 *
 * The table must outlive every Guard it hands out.
 */
class EntityLockTable {
public:
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&& other) noexcept : table_(other.table_), entity_id_(std::move(other.entity_id_)) {
            other.table_ = nullptr;
        }
        Guard& operator=(Guard&& other) noexcept;
        ~Guard() { release(); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owns_lock() const { return table_ != nullptr; }
        explicit operator bool() const { return owns_lock(); }
        void release();

    private:
        friend class EntityLockTable;
        Guard(EntityLockTable* table, std::string entity_id)
            : table_(table), entity_id_(std::move(entity_id)) {}

        EntityLockTable* table_ = nullptr;
        std::string entity_id_;
    };

    // Non-blocking; the guard is empty if another operation holds the lock
    Guard try_acquire(const std::string& entity_id);

    // Blocks up to timeout
    Guard acquire(const std::string& entity_id, std::chrono::milliseconds timeout);

    bool is_locked(const std::string& entity_id) const;

private:
    void unlock(const std::string& entity_id);

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_set<std::string> held_;
};

} // namespace savekeeper
