#include "entity_lock.hpp"

namespace savekeeper {

EntityLockTable::Guard& EntityLockTable::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        table_ = other.table_;
        entity_id_ = std::move(other.entity_id_);
        other.table_ = nullptr;
    }
    return *this;
}

void EntityLockTable::Guard::release() {
    if (table_) {
        table_->unlock(entity_id_);
        table_ = nullptr;
    }
}

EntityLockTable::Guard EntityLockTable::try_acquire(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.insert(entity_id).second) {
        return Guard();
    }
    return Guard(this, entity_id);
}

EntityLockTable::Guard EntityLockTable::acquire(const std::string& entity_id,
                                                std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool free = released_.wait_for(lock, timeout, [this, &entity_id] {
        return held_.count(entity_id) == 0;
    });
    if (!free) {
        return Guard();
    }
    held_.insert(entity_id);
    return Guard(this, entity_id);
}

bool EntityLockTable::is_locked(const std::string& entity_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(entity_id) != 0;
}

void EntityLockTable::unlock(const std::string& entity_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(entity_id);
    }
    released_.notify_all();
}

} // namespace savekeeper
