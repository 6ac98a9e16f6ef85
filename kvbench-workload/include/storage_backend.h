#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "types.h"

namespace kvbench {

/**
 * @class StorageBackend
 * @brief Minimal point-operation contract of a benchmarked key-value store.
 *
 * Implementations must tolerate Get and Set being called concurrently from
 * any number of threads; the benchmark engine takes no lock of its own.
 */
class StorageBackend {
   public:
    virtual ~StorageBackend() = default;

    /**
     * @brief Prepares the store (namespace, table, ...); may be a no-op
     * @return ErrorCode::BACKEND_INIT_FAIL on failure
     */
    virtual tl::expected<void, ErrorCode> Init() = 0;

    /**
     * @brief Looks up `key`; the value is discarded
     *
     * A missing key is not an error.
     * @return ErrorCode::BACKEND_READ_FAIL on failure
     */
    virtual tl::expected<void, ErrorCode> Get(std::string_view key) = 0;

    /**
     * @brief Inserts or overwrites `key`
     * @return ErrorCode::BACKEND_WRITE_FAIL on failure
     */
    virtual tl::expected<void, ErrorCode> Set(std::string_view key,
                                              std::string_view value) = 0;

    virtual std::string Name() const = 0;
};

enum class BackendType {
    MEM_BTREE = 0,    // MemBTreeBackend
    ROCKSDB = 1,      // RocksDBBackend
    ROCKSDB_TXN = 2,  // RocksDBTxnBackend
};

std::string BackendTypeToString(BackendType type);

std::optional<BackendType> StringToBackendType(const std::string& str);

inline std::ostream& operator<<(std::ostream& os,
                                const BackendType& type) noexcept {
    return os << BackendTypeToString(type);
}

/**
 * @brief Constructs the backend selected by `type`
 * @return ErrorCode::BACKEND_UNAVAILABLE if the backend is not compiled in,
 * ErrorCode::BACKEND_INIT_FAIL if its storage cannot be opened
 */
tl::expected<std::shared_ptr<StorageBackend>, ErrorCode> CreateStorageBackend(
    BackendType type);

inline std::string_view AsStringView(const Bytes& bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace kvbench
