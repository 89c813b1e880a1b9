#include "storage/rocksdb_document_store.h"
#include "query/selector_matcher.h"
#include "schema/namespacer.h"
#include "utils/id_generator.h"
#include "utils/logger.h"

#include <rocksdb/db.h>
#include <rocksdb/utilities/transaction_db.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/options.h>
#include <rocksdb/iterator.h>
#include <rocksdb/table.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/cache.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>
#include <fmt/format.h>

namespace docbridge {

using nlohmann::json;

namespace {

StoreStatus fromRocks(const rocksdb::Status& s, std::string_view context) {
    if (s.ok()) return StoreStatus::OK();
    if (s.IsNotFound()) return StoreStatus::NotFound();
    std::string msg = std::string(context) + ": " + s.ToString();
    if (s.IsTimedOut() || s.IsBusy()) return StoreStatus::Timeout(msg);
    return StoreStatus::Error(msg);
}

std::optional<json> parseBody(const std::string& raw) {
    json doc = json::parse(raw, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
    return doc;
}

std::optional<std::string> revOf(const json& doc) {
    auto it = doc.find("_rev");
    if (it == doc.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

json projectFields(const json& doc, const std::vector<std::string>& fields) {
    if (fields.empty()) return doc;
    json out = json::object();
    for (const auto& f : fields) {
        auto it = doc.find(f);
        if (it != doc.end()) out[f] = *it;
    }
    return out;
}

} // namespace

RocksDBDocumentStore::RocksDBDocumentStore(const Config& config) : config_(config) {
    options_ = std::make_unique<rocksdb::Options>();
    txn_db_options_ = std::make_unique<rocksdb::TransactionDBOptions>();
    txn_options_ = std::make_unique<rocksdb::TransactionOptions>();
    read_options_ = std::make_unique<rocksdb::ReadOptions>();
    write_options_ = std::make_unique<rocksdb::WriteOptions>();
    configureOptions();
}

RocksDBDocumentStore::~RocksDBDocumentStore() {
    close();
}

void RocksDBDocumentStore::configureOptions() {
    options_->create_if_missing = true;

    options_->write_buffer_size = config_.memtable_size_mb * 1024 * 1024;

    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.block_cache_size_mb * 1024 * 1024);
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(config_.bloom_bits_per_key, false));
    options_->table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    auto toCompression = [](const std::string& s) {
        std::string v = s;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return std::tolower(c); });
        if (v == "lz4") return rocksdb::kLZ4Compression;
        if (v == "zstd") return rocksdb::kZSTD;
        if (v == "snappy") return rocksdb::kSnappyCompression;
        if (v == "zlib") return rocksdb::kZlibCompression;
        return rocksdb::kNoCompression;
    };
    options_->compression = toCompression(config_.compression);

    write_options_->disableWAL = !config_.enable_wal;

    // Pessimistische Locks pro Dokument, Wartezeit begrenzt
    txn_db_options_->transaction_lock_timeout = config_.lock_timeout_ms;
    txn_db_options_->default_lock_timeout = config_.lock_timeout_ms;
    txn_options_->lock_timeout = config_.lock_timeout_ms;
}

bool RocksDBDocumentStore::open() {
    if (db_) return true;

    std::error_code ec;
    std::filesystem::create_directories(config_.db_path, ec);
    if (ec) {
        DOCBRIDGE_ERROR("Failed to create store directory '{}': {}", config_.db_path, ec.message());
        return false;
    }

    rocksdb::TransactionDB* txn_db_ptr = nullptr;
    rocksdb::Status status = rocksdb::TransactionDB::Open(
        *options_,
        *txn_db_options_,
        config_.db_path,
        &txn_db_ptr
    );
    if (!status.ok()) {
        DOCBRIDGE_ERROR("Failed to open RocksDB TransactionDB: {}", status.ToString());
        return false;
    }

    db_.reset(txn_db_ptr);
    DOCBRIDGE_INFO("Opened document store at: {}", config_.db_path);
    return true;
}

void RocksDBDocumentStore::close() {
    if (db_) {
        DOCBRIDGE_INFO("Closing document store");
        db_.reset();
    }
}

bool RocksDBDocumentStore::isOpen() const {
    return db_ != nullptr;
}

std::string RocksDBDocumentStore::nextRevision(const std::optional<std::string>& current, const json& body) {
    unsigned long generation = 0;
    if (current) {
        try {
            generation = std::stoul(current->substr(0, current->find('-')));
        } catch (const std::exception&) {
            generation = 0;
        }
    }
    size_t digest = std::hash<std::string>{}(body.dump());
    return fmt::format("{}-{:016x}", generation + 1, static_cast<uint64_t>(digest));
}

std::pair<StoreStatus, json> RocksDBDocumentStore::get(std::string_view encoded_id) {
    if (!db_) return {StoreStatus::Error("store not open"), json()};

    std::string id = Namespacer::decodeFromTransport(encoded_id);
    std::string value;
    rocksdb::Status s = db_->Get(*read_options_, rocksdb::Slice(id), &value);
    if (!s.ok()) {
        StoreStatus st = fromRocks(s, "get " + id);
        if (!st.isNotFound()) DOCBRIDGE_ERROR("DocumentStore: {}", st.message);
        return {st, json()};
    }
    auto doc = parseBody(value);
    if (!doc) return {StoreStatus::Error("corrupt document body for " + id), json()};
    return {StoreStatus::OK(), std::move(*doc)};
}

std::pair<StoreStatus, DocumentStore::PutResult> RocksDBDocumentStore::put(std::string_view encoded_id,
                                                                           const json& body,
                                                                           const std::optional<std::string>& rev) {
    if (!body.is_object()) return {StoreStatus::BadRequest("document body must be an object"), {}};
    return writeDocument_(Namespacer::decodeFromTransport(encoded_id), body, rev);
}

std::pair<StoreStatus, DocumentStore::PutResult> RocksDBDocumentStore::writeDocument_(
    const std::string& id, const json& body, const std::optional<std::string>& rev) {
    if (!db_) return {StoreStatus::Error("store not open"), {}};
    if (id.empty()) return {StoreStatus::BadRequest("empty document id"), {}};

    std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(*write_options_, *txn_options_));
    if (!txn) return {StoreStatus::Error("failed to begin transaction"), {}};

    std::string existing_raw;
    rocksdb::Status s = txn->GetForUpdate(*read_options_, rocksdb::Slice(id), &existing_raw);
    if (!s.ok() && !s.IsNotFound()) {
        txn->Rollback();
        return {fromRocks(s, "lock " + id), {}};
    }

    std::optional<std::string> current_rev;
    if (s.ok()) {
        auto existing = parseBody(existing_raw);
        if (existing) current_rev = revOf(*existing);
        if (!current_rev) current_rev = std::string("0-");
    }

    bool deleted = body.contains("_deleted") && body["_deleted"].is_boolean() && body["_deleted"].get<bool>();
    if (deleted && !current_rev) {
        txn->Rollback();
        return {StoreStatus::NotFound("deleted"), PutResult{id, ""}};
    }

    // Revisionsprüfung: neues Dokument ohne rev, bestehendes nur mit passender rev
    if (current_rev.has_value() != rev.has_value() || (current_rev && *current_rev != *rev)) {
        txn->Rollback();
        return {StoreStatus::Conflict(), PutResult{id, ""}};
    }

    json doc = body;
    doc.erase("_rev");
    doc["_id"] = id;
    std::string new_rev = nextRevision(current_rev, doc);

    if (deleted) {
        s = txn->Delete(rocksdb::Slice(id));
    } else {
        doc["_rev"] = new_rev;
        s = txn->Put(rocksdb::Slice(id), rocksdb::Slice(doc.dump()));
    }
    if (!s.ok()) {
        txn->Rollback();
        return {fromRocks(s, "write " + id), {}};
    }

    s = txn->Commit();
    if (!s.ok()) {
        StoreStatus st = fromRocks(s, "commit " + id);
        DOCBRIDGE_ERROR("DocumentStore: {}", st.message);
        return {st, {}};
    }
    return {StoreStatus::OK(), PutResult{id, new_rev}};
}

std::pair<StoreStatus, std::vector<DocumentStore::BulkItemResult>> RocksDBDocumentStore::bulkPut(
    const std::vector<json>& docs) {
    std::vector<BulkItemResult> results;
    if (!db_) return {StoreStatus::Error("store not open"), results};

    results.reserve(docs.size());
    for (const auto& doc : docs) {
        BulkItemResult item;
        if (!doc.is_object()) {
            item.error = "bad_request";
            item.reason = "Document must be a JSON object";
            results.push_back(std::move(item));
            continue;
        }

        item.id = doc.contains("_id") && doc["_id"].is_string()
            ? doc["_id"].get<std::string>()
            : utils::generateUuid();
        std::optional<std::string> rev = revOf(doc);

        auto [st, res] = writeDocument_(item.id, doc, rev);
        if (st.ok()) {
            item.rev = res.rev;
        } else {
            item.error = st.errorName();
            item.reason = st.message;
        }
        results.push_back(std::move(item));
    }
    return {StoreStatus::OK(), std::move(results)};
}

std::pair<StoreStatus, json> RocksDBDocumentStore::find(const json& selector, const FindOptions& options) {
    if (!db_) return {StoreStatus::Error("store not open"), json()};

    query::SelectorMatcher matcher(selector);
    auto vst = matcher.validate();
    if (!vst.ok) return {StoreStatus::BadRequest(vst.message), json()};

    std::vector<json> matched;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        auto doc = parseBody(it->value().ToString());
        if (doc && matcher.matches(*doc)) matched.push_back(std::move(*doc));
    }
    if (!it->status().ok()) {
        StoreStatus st = fromRocks(it->status(), "find");
        DOCBRIDGE_ERROR("DocumentStore: {}", st.message);
        return {st, json()};
    }

    if (!options.sort.empty()) {
        static const json kNull;
        std::stable_sort(matched.begin(), matched.end(), [&](const json& a, const json& b) {
            for (const auto& key : options.sort) {
                const json* va = query::SelectorMatcher::lookup(a, key.field);
                const json* vb = query::SelectorMatcher::lookup(b, key.field);
                int c = query::SelectorMatcher::compare(va ? *va : kNull, vb ? *vb : kNull);
                if (c != 0) return key.direction == SortDirection::Desc ? c > 0 : c < 0;
            }
            return false;
        });
    }

    size_t skip = options.skip.value_or(0);
    size_t limit = options.limit.value_or(config_.default_find_limit);

    json docs = json::array();
    std::string bookmark = "nil";
    for (size_t i = skip; i < matched.size() && docs.size() < limit; ++i) {
        bookmark = matched[i].value("_id", bookmark);
        docs.push_back(projectFields(matched[i], options.fields));
    }
    return {StoreStatus::OK(), json{{"docs", std::move(docs)}, {"bookmark", bookmark}}};
}

std::pair<StoreStatus, json> RocksDBDocumentStore::rangeScan(const RangeScanOptions& options) {
    if (!db_) return {StoreStatus::Error("store not open"), json()};

    json rows = json::array();
    size_t skipped = 0;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));

    // Beide Grenzen inklusive; absteigend kommt start_key als obere Grenze
    auto inRange = [&](const std::string& key) {
        return options.descending ? key >= options.end_key : key <= options.end_key;
    };
    if (options.descending) {
        it->SeekForPrev(rocksdb::Slice(options.start_key));
    } else {
        it->Seek(rocksdb::Slice(options.start_key));
    }

    for (; it->Valid() && rows.size() < options.limit;
         options.descending ? it->Prev() : it->Next()) {
        std::string key = it->key().ToString();
        if (!inRange(key)) break;
        if (skipped < options.skip) { ++skipped; continue; }

        auto doc = parseBody(it->value().ToString());
        if (!doc) continue;
        json row = {
            {"id", key},
            {"key", key},
            {"value", {{"rev", revOf(*doc).value_or("")}}}
        };
        if (options.include_docs) row["doc"] = std::move(*doc);
        rows.push_back(std::move(row));
    }
    if (!it->status().ok()) {
        StoreStatus st = fromRocks(it->status(), "range scan");
        DOCBRIDGE_ERROR("DocumentStore: {}", st.message);
        return {st, json()};
    }
    return {StoreStatus::OK(), json{{"offset", options.skip}, {"rows", std::move(rows)}}};
}

std::pair<StoreStatus, json> RocksDBDocumentStore::allDocs(const std::vector<std::string>& keys, bool include_docs) {
    if (!db_) return {StoreStatus::Error("store not open"), json()};

    json rows = json::array();
    for (const auto& key : keys) {
        std::string value;
        rocksdb::Status s = db_->Get(*read_options_, rocksdb::Slice(key), &value);
        if (s.IsNotFound()) {
            rows.push_back(json{{"key", key}, {"error", "not_found"}});
            continue;
        }
        if (!s.ok()) {
            StoreStatus st = fromRocks(s, "all_docs " + key);
            DOCBRIDGE_ERROR("DocumentStore: {}", st.message);
            return {st, json()};
        }
        auto doc = parseBody(value);
        if (!doc) {
            rows.push_back(json{{"key", key}, {"error", "corrupt"}});
            continue;
        }
        json row = {
            {"id", key},
            {"key", key},
            {"value", {{"rev", revOf(*doc).value_or("")}}}
        };
        if (include_docs) row["doc"] = std::move(*doc);
        rows.push_back(std::move(row));
    }
    return {StoreStatus::OK(), json{{"offset", 0}, {"rows", std::move(rows)}}};
}

StoreStatus RocksDBDocumentStore::remove(std::string_view encoded_id, std::string_view rev) {
    json tombstone = {{"_deleted", true}};
    auto [st, res] = writeDocument_(Namespacer::decodeFromTransport(encoded_id), tombstone, std::string(rev));
    return st;
}

size_t RocksDBDocumentStore::countDocuments() {
    if (!db_) return 0;
    size_t n = 0;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) ++n;
    return n;
}

} // namespace docbridge
