#pragma once

#include <atomic>
#include <map>
#include <shared_mutex>
#include <string>

#include "storage_backend.h"

namespace kvbench {

/**
 * @brief In-memory ordered map behind a reader/writer lock.
 *
 * Readers share the lock, writers take it exclusively.
 */
class MemBTreeBackend : public StorageBackend {
   public:
    MemBTreeBackend() = default;

    tl::expected<void, ErrorCode> Init() override { return {}; }

    tl::expected<void, ErrorCode> Get(std::string_view key) override;

    tl::expected<void, ErrorCode> Set(std::string_view key,
                                      std::string_view value) override;

    std::string Name() const override { return "MemBtree"; }

    size_t Size() const;

    bool Contains(std::string_view key) const;

    // Gets that found no entry.
    uint64_t Misses() const { return misses_.load(std::memory_order_relaxed); }

   private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::string, std::less<>> data_;
    std::atomic<uint64_t> misses_{0};
};

}  // namespace kvbench
