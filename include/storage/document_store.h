#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace docbridge {

/// Outcome of a single store call. NotFound is a normal result for existence checks;
/// everything except Ok/NotFound is a store error.
struct StoreStatus {
    enum class Code { Ok, NotFound, Conflict, Timeout, BadRequest, Error };

    Code code = Code::Ok;
    std::string message;

    bool ok() const { return code == Code::Ok; }
    bool isNotFound() const { return code == Code::NotFound; }
    bool isConflict() const { return code == Code::Conflict; }

    /// CouchDB-style error token ("not_found", "conflict", ...)
    const char* errorName() const;

    static StoreStatus OK() { return {}; }
    static StoreStatus NotFound(std::string msg = "missing") { return {Code::NotFound, std::move(msg)}; }
    static StoreStatus Conflict(std::string msg = "Document update conflict.") { return {Code::Conflict, std::move(msg)}; }
    static StoreStatus Timeout(std::string msg) { return {Code::Timeout, std::move(msg)}; }
    static StoreStatus BadRequest(std::string msg) { return {Code::BadRequest, std::move(msg)}; }
    static StoreStatus Error(std::string msg) { return {Code::Error, std::move(msg)}; }
};

enum class SortDirection { Asc, Desc };

struct SortField {
    std::string field;
    SortDirection direction = SortDirection::Asc;

    bool operator==(const SortField& o) const { return field == o.field && direction == o.direction; }
};

/// Options of a selector query (Mango-style _find body minus the selector)
struct FindOptions {
    std::optional<size_t> limit;
    std::vector<SortField> sort;
    std::optional<size_t> skip;
    std::vector<std::string> fields; // leer = ganze Dokumente

    bool operator==(const FindOptions& o) const {
        return limit == o.limit && sort == o.sort && skip == o.skip && fields == o.fields;
    }
};

/// Ordered key-range scan over document ids, [start_key, end_key] in traversal order
struct RangeScanOptions {
    std::string start_key;
    std::string end_key;
    size_t limit = 100;
    size_t skip = 0;
    bool descending = false;
    bool include_docs = true;
};

/// Session handle to a revision-based document store.
///
/// Path-style ids (get/put/remove) arrive percent-encoded, see
/// Namespacer::encodeForTransport. Ids inside bodies and scan keys are plain.
/// Every call blocks and is bounded by the store's own timeout.
class DocumentStore {
public:
    struct PutResult {
        std::string id;
        std::string rev;
    };

    struct BulkItemResult {
        std::string id;
        std::optional<std::string> rev;
        std::string error;  // leer bei Erfolg
        std::string reason;

        bool ok() const { return error.empty() && rev.has_value(); }
    };

    virtual ~DocumentStore() = default;

    /// Document body (with _id/_rev) or NotFound
    virtual std::pair<StoreStatus, nlohmann::json> get(std::string_view encoded_id) = 0;

    /// Write a full document body; rev must match the stored revision (nullopt = create)
    virtual std::pair<StoreStatus, PutResult> put(std::string_view encoded_id,
                                                  const nlohmann::json& body,
                                                  const std::optional<std::string>& rev) = 0;

    /// One outcome per input document, input order preserved
    virtual std::pair<StoreStatus, std::vector<BulkItemResult>> bulkPut(const std::vector<nlohmann::json>& docs) = 0;

    /// {"docs": [...], "bookmark": "..."}
    virtual std::pair<StoreStatus, nlohmann::json> find(const nlohmann::json& selector, const FindOptions& options) = 0;

    /// {"offset": n, "rows": [{"id", "key", "value": {"rev"}, "doc"}]}
    virtual std::pair<StoreStatus, nlohmann::json> rangeScan(const RangeScanOptions& options) = 0;

    /// Batch lookup; missing keys produce {"key", "error": "not_found"} rows
    virtual std::pair<StoreStatus, nlohmann::json> allDocs(const std::vector<std::string>& keys,
                                                           bool include_docs) = 0;

    virtual StoreStatus remove(std::string_view encoded_id, std::string_view rev) = 0;
};

} // namespace docbridge
