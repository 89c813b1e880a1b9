#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "storage/document_store.h"

namespace rocksdb {
    class TransactionDB;
    class Options;
    class ReadOptions;
    class WriteOptions;
    class TransactionDBOptions;
    class TransactionOptions;
}

namespace docbridge {

/// Embedded revision-based document store on a RocksDB TransactionDB.
/// One key per document (the unencoded document id), value is the JSON body
/// including _id and _rev. Writes take a per-key lock (GetForUpdate) and check
/// the revision before committing; selectors are evaluated locally.
class RocksDBDocumentStore : public DocumentStore {
public:
    struct Config {
        std::string db_path = "./data/docbridge";
        size_t memtable_size_mb = 64;
        size_t block_cache_size_mb = 128;
        int bloom_bits_per_key = 10;
        bool enable_wal = true;
        int64_t lock_timeout_ms = 1000;   // Wartezeit auf Dokument-Locks
        size_t default_find_limit = 25;   // _find ohne limit
        // Values: "none", "lz4", "zstd", "snappy", "zlib"
        std::string compression = "none";
    };

    explicit RocksDBDocumentStore(const Config& config);
    ~RocksDBDocumentStore() override;

    RocksDBDocumentStore(const RocksDBDocumentStore&) = delete;
    RocksDBDocumentStore& operator=(const RocksDBDocumentStore&) = delete;

    /// Open the database (creates the directory if missing)
    bool open();
    void close();
    bool isOpen() const;

    std::pair<StoreStatus, nlohmann::json> get(std::string_view encoded_id) override;

    std::pair<StoreStatus, PutResult> put(std::string_view encoded_id,
                                          const nlohmann::json& body,
                                          const std::optional<std::string>& rev) override;

    std::pair<StoreStatus, std::vector<BulkItemResult>> bulkPut(const std::vector<nlohmann::json>& docs) override;

    std::pair<StoreStatus, nlohmann::json> find(const nlohmann::json& selector, const FindOptions& options) override;

    std::pair<StoreStatus, nlohmann::json> rangeScan(const RangeScanOptions& options) override;

    std::pair<StoreStatus, nlohmann::json> allDocs(const std::vector<std::string>& keys,
                                                   bool include_docs) override;

    StoreStatus remove(std::string_view encoded_id, std::string_view rev) override;

    /// Number of stored documents (full scan; tests and diagnostics)
    size_t countDocuments();

    const Config& getConfig() const { return config_; }

    /// "<generation>-<16 hex digits>"
    static std::string nextRevision(const std::optional<std::string>& current, const nlohmann::json& body);

private:
    Config config_;
    std::unique_ptr<rocksdb::TransactionDB> db_;
    std::unique_ptr<rocksdb::Options> options_;
    std::unique_ptr<rocksdb::TransactionDBOptions> txn_db_options_;
    std::unique_ptr<rocksdb::TransactionOptions> txn_options_;
    std::unique_ptr<rocksdb::ReadOptions> read_options_;
    std::unique_ptr<rocksdb::WriteOptions> write_options_;

    void configureOptions();

    /// Revision-checked single-document write; body with "_deleted": true deletes
    std::pair<StoreStatus, PutResult> writeDocument_(const std::string& id,
                                                     const nlohmann::json& body,
                                                     const std::optional<std::string>& rev);
};

} // namespace docbridge
