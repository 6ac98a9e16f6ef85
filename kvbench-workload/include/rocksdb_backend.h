#pragma once

#include <rocksdb/db.h>
#include <rocksdb/utilities/transaction_db.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "storage_backend.h"

namespace kvbench {

/**
 * @brief Private scratch directory removed on destruction.
 */
class ScratchDirectory {
   public:
    static tl::expected<std::unique_ptr<ScratchDirectory>, ErrorCode> Create(
        const std::string& prefix);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::string& path() const { return path_; }

   private:
    explicit ScratchDirectory(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

/**
 * @brief Embedded log-structured store (RocksDB) with one Put/Get per
 * operation.
 */
class RocksDBBackend : public StorageBackend {
   public:
    static tl::expected<std::shared_ptr<RocksDBBackend>, ErrorCode> Create();

    ~RocksDBBackend() override;

    tl::expected<void, ErrorCode> Init() override { return {}; }

    tl::expected<void, ErrorCode> Get(std::string_view key) override;

    tl::expected<void, ErrorCode> Set(std::string_view key,
                                      std::string_view value) override;

    std::string Name() const override { return "RocksDB"; }

   private:
    RocksDBBackend(std::unique_ptr<ScratchDirectory> dir,
                   std::unique_ptr<rocksdb::DB> db)
        : dir_(std::move(dir)), db_(std::move(db)) {}

    std::unique_ptr<ScratchDirectory> dir_;
    std::unique_ptr<rocksdb::DB> db_;
};

/**
 * @brief Embedded transactional store (RocksDB TransactionDB).
 *
 * Init() creates the "data" column family; every Set commits its own
 * transaction and every Get reads inside a transaction that is rolled back.
 */
class RocksDBTxnBackend : public StorageBackend {
   public:
    static tl::expected<std::shared_ptr<RocksDBTxnBackend>, ErrorCode>
    Create();

    ~RocksDBTxnBackend() override;

    tl::expected<void, ErrorCode> Init() override;

    tl::expected<void, ErrorCode> Get(std::string_view key) override;

    tl::expected<void, ErrorCode> Set(std::string_view key,
                                      std::string_view value) override;

    std::string Name() const override { return "RocksDBTxn"; }

   private:
    RocksDBTxnBackend(std::unique_ptr<ScratchDirectory> dir,
                      std::unique_ptr<rocksdb::TransactionDB> db)
        : dir_(std::move(dir)), db_(std::move(db)) {}

    std::unique_ptr<ScratchDirectory> dir_;
    std::unique_ptr<rocksdb::TransactionDB> db_;
    std::mutex init_mutex_;
    std::atomic<rocksdb::ColumnFamilyHandle*> table_{nullptr};
};

}  // namespace kvbench
