#include "rocksdb_backend.h"

#include <glog/logging.h>
#include <rocksdb/options.h>
#include <rocksdb/utilities/transaction.h>
#include <stdlib.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

namespace kvbench {

namespace {
constexpr const char* kTableName = "data";

inline rocksdb::Slice ToSlice(std::string_view view) {
    return rocksdb::Slice(view.data(), view.size());
}

rocksdb::Options DefaultOptions() {
    rocksdb::Options options;
    options.create_if_missing = true;
    options.compression = rocksdb::kNoCompression;
    return options;
}
}  // namespace

tl::expected<std::unique_ptr<ScratchDirectory>, ErrorCode>
ScratchDirectory::Create(const std::string& prefix) {
    std::string templ =
        (std::filesystem::temp_directory_path() / (prefix + "XXXXXX"))
            .string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        LOG(ERROR) << "Failed to create scratch directory " << templ << ": "
                   << std::strerror(errno);
        return tl::make_unexpected(ErrorCode::BACKEND_INIT_FAIL);
    }
    return std::unique_ptr<ScratchDirectory>(
        new ScratchDirectory(std::string(buf.data())));
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG(WARNING) << "Failed to remove scratch directory " << path_ << ": "
                     << ec.message();
    }
}

// ---------------------------------------------------------------------------
// RocksDBBackend
// ---------------------------------------------------------------------------

tl::expected<std::shared_ptr<RocksDBBackend>, ErrorCode>
RocksDBBackend::Create() {
    auto dir = ScratchDirectory::Create("kvbench_rocksdb_");
    if (!dir) {
        return tl::make_unexpected(dir.error());
    }
    rocksdb::DB* raw_db = nullptr;
    rocksdb::Status status =
        rocksdb::DB::Open(DefaultOptions(), dir.value()->path(), &raw_db);
    if (!status.ok()) {
        LOG(ERROR) << "Failed to open RocksDB at " << dir.value()->path()
                   << ": " << status.ToString();
        return tl::make_unexpected(ErrorCode::BACKEND_INIT_FAIL);
    }
    LOG(INFO) << "Opened RocksDB at " << dir.value()->path();
    return std::shared_ptr<RocksDBBackend>(new RocksDBBackend(
        std::move(dir.value()), std::unique_ptr<rocksdb::DB>(raw_db)));
}

RocksDBBackend::~RocksDBBackend() {
    if (db_) {
        rocksdb::Status status = db_->Close();
        if (!status.ok()) {
            LOG(WARNING) << "Failed to close RocksDB: " << status.ToString();
        }
        db_.reset();
    }
}

tl::expected<void, ErrorCode> RocksDBBackend::Get(std::string_view key) {
    std::string value;
    rocksdb::Status status =
        db_->Get(rocksdb::ReadOptions(), ToSlice(key), &value);
    if (!status.ok() && !status.IsNotFound()) {
        LOG(ERROR) << "RocksDB get failed: " << status.ToString();
        return tl::make_unexpected(ErrorCode::BACKEND_READ_FAIL);
    }
    return {};
}

tl::expected<void, ErrorCode> RocksDBBackend::Set(std::string_view key,
                                                  std::string_view value) {
    rocksdb::Status status =
        db_->Put(rocksdb::WriteOptions(), ToSlice(key), ToSlice(value));
    if (!status.ok()) {
        LOG(ERROR) << "RocksDB put failed: " << status.ToString();
        return tl::make_unexpected(ErrorCode::BACKEND_WRITE_FAIL);
    }
    return {};
}

// ---------------------------------------------------------------------------
// RocksDBTxnBackend
// ---------------------------------------------------------------------------

tl::expected<std::shared_ptr<RocksDBTxnBackend>, ErrorCode>
RocksDBTxnBackend::Create() {
    auto dir = ScratchDirectory::Create("kvbench_rocksdb_txn_");
    if (!dir) {
        return tl::make_unexpected(dir.error());
    }
    rocksdb::TransactionDB* raw_db = nullptr;
    rocksdb::Status status = rocksdb::TransactionDB::Open(
        DefaultOptions(), rocksdb::TransactionDBOptions(),
        dir.value()->path(), &raw_db);
    if (!status.ok()) {
        LOG(ERROR) << "Failed to open RocksDB TransactionDB at "
                   << dir.value()->path() << ": " << status.ToString();
        return tl::make_unexpected(ErrorCode::BACKEND_INIT_FAIL);
    }
    LOG(INFO) << "Opened RocksDB TransactionDB at " << dir.value()->path();
    return std::shared_ptr<RocksDBTxnBackend>(
        new RocksDBTxnBackend(std::move(dir.value()),
                              std::unique_ptr<rocksdb::TransactionDB>(raw_db)));
}

RocksDBTxnBackend::~RocksDBTxnBackend() {
    if (!db_) {
        return;
    }
    rocksdb::ColumnFamilyHandle* table = table_.exchange(nullptr);
    if (table != nullptr) {
        rocksdb::Status status = db_->DestroyColumnFamilyHandle(table);
        if (!status.ok()) {
            LOG(WARNING) << "Failed to release column family handle: "
                         << status.ToString();
        }
    }
    rocksdb::Status status = db_->Close();
    if (!status.ok()) {
        LOG(WARNING) << "Failed to close RocksDB TransactionDB: "
                     << status.ToString();
    }
    db_.reset();
}

tl::expected<void, ErrorCode> RocksDBTxnBackend::Init() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (table_.load() != nullptr) {
        return {};
    }
    rocksdb::ColumnFamilyHandle* handle = nullptr;
    rocksdb::Status status = db_->CreateColumnFamily(
        rocksdb::ColumnFamilyOptions(), kTableName, &handle);
    if (!status.ok()) {
        LOG(ERROR) << "Failed to create column family " << kTableName << ": "
                   << status.ToString();
        return tl::make_unexpected(ErrorCode::BACKEND_INIT_FAIL);
    }
    table_.store(handle);
    return {};
}

tl::expected<void, ErrorCode> RocksDBTxnBackend::Get(std::string_view key) {
    rocksdb::ColumnFamilyHandle* table = table_.load();
    if (table == nullptr) {
        LOG(ERROR) << "RocksDB TransactionDB read before Init";
        return tl::make_unexpected(ErrorCode::BACKEND_READ_FAIL);
    }
    std::unique_ptr<rocksdb::Transaction> txn(
        db_->BeginTransaction(rocksdb::WriteOptions()));
    std::string value;
    rocksdb::Status status =
        txn->Get(rocksdb::ReadOptions(), table, ToSlice(key), &value);
    if (!status.ok() && !status.IsNotFound()) {
        LOG(ERROR) << "RocksDB transactional get failed: "
                   << status.ToString();
        return tl::make_unexpected(ErrorCode::BACKEND_READ_FAIL);
    }
    status = txn->Rollback();
    if (!status.ok()) {
        LOG(ERROR) << "RocksDB read transaction rollback failed: "
                   << status.ToString();
        return tl::make_unexpected(ErrorCode::BACKEND_READ_FAIL);
    }
    return {};
}

tl::expected<void, ErrorCode> RocksDBTxnBackend::Set(std::string_view key,
                                                     std::string_view value) {
    rocksdb::ColumnFamilyHandle* table = table_.load();
    if (table == nullptr) {
        LOG(ERROR) << "RocksDB TransactionDB write before Init";
        return tl::make_unexpected(ErrorCode::BACKEND_WRITE_FAIL);
    }
    std::unique_ptr<rocksdb::Transaction> txn(
        db_->BeginTransaction(rocksdb::WriteOptions()));
    rocksdb::Status status = txn->Put(table, ToSlice(key), ToSlice(value));
    if (status.ok()) {
        status = txn->Commit();
    }
    if (!status.ok()) {
        LOG(ERROR) << "RocksDB transactional put failed: "
                   << status.ToString();
        return tl::make_unexpected(ErrorCode::BACKEND_WRITE_FAIL);
    }
    return {};
}

}  // namespace kvbench
