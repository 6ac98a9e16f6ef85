#include "mem_btree_backend.h"

#include <mutex>

namespace kvbench {

tl::expected<void, ErrorCode> MemBTreeBackend::Get(std::string_view key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (data_.find(key) == data_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return {};
}

tl::expected<void, ErrorCode> MemBTreeBackend::Set(std::string_view key,
                                                   std::string_view value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    data_.insert_or_assign(std::string(key), std::string(value));
    return {};
}

size_t MemBTreeBackend::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.size();
}

bool MemBTreeBackend::Contains(std::string_view key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.find(key) != data_.end();
}

}  // namespace kvbench
