#include "storage_backend.h"

#include <glog/logging.h>

#include "mem_btree_backend.h"
#ifdef KVBENCH_WITH_ROCKSDB
#include "rocksdb_backend.h"
#endif

namespace kvbench {

std::string BackendTypeToString(BackendType type) {
    switch (type) {
        case BackendType::MEM_BTREE:
            return "mem_btree";
        case BackendType::ROCKSDB:
            return "rocksdb";
        case BackendType::ROCKSDB_TXN:
            return "rocksdb_txn";
    }
    return "unknown";
}

std::optional<BackendType> StringToBackendType(const std::string& str) {
    if (str == "mem_btree") return BackendType::MEM_BTREE;
    if (str == "rocksdb") return BackendType::ROCKSDB;
    if (str == "rocksdb_txn") return BackendType::ROCKSDB_TXN;
    return std::nullopt;
}

tl::expected<std::shared_ptr<StorageBackend>, ErrorCode> CreateStorageBackend(
    BackendType type) {
    switch (type) {
        case BackendType::MEM_BTREE:
            return std::make_shared<MemBTreeBackend>();
#ifdef KVBENCH_WITH_ROCKSDB
        case BackendType::ROCKSDB: {
            auto backend = RocksDBBackend::Create();
            if (!backend) {
                return tl::make_unexpected(backend.error());
            }
            return std::shared_ptr<StorageBackend>(std::move(backend.value()));
        }
        case BackendType::ROCKSDB_TXN: {
            auto backend = RocksDBTxnBackend::Create();
            if (!backend) {
                return tl::make_unexpected(backend.error());
            }
            return std::shared_ptr<StorageBackend>(std::move(backend.value()));
        }
#else
        case BackendType::ROCKSDB:
        case BackendType::ROCKSDB_TXN:
            LOG(ERROR) << "Backend " << type
                       << " is not available, rebuild with "
                          "-DKVBENCH_WITH_ROCKSDB=ON";
            return tl::make_unexpected(ErrorCode::BACKEND_UNAVAILABLE);
#endif
    }
    LOG(ERROR) << "Unknown backend type: " << static_cast<int>(type);
    return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
}

}  // namespace kvbench
