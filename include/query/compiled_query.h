#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

#include "storage/document_store.h"

namespace docbridge {
namespace query {

/// Lookup of exactly one document by qualified id
struct PointGet {
    std::string id;

    bool operator==(const PointGet& o) const { return id == o.id; }
};

/// Lookup of several documents by qualified ids (input order)
struct BatchGet {
    std::vector<std::string> ids;

    bool operator==(const BatchGet& o) const { return ids == o.ids; }
};

/// Selector query; selector always carries {"type": namespace}
struct SelectorQuery {
    nlohmann::json selector;
    FindOptions options;

    bool operator==(const SelectorQuery& o) const { return selector == o.selector && options == o.options; }
};

/// Ordered scan over the id space; bounds already swapped when descending
struct RangeScan {
    std::string start_key;
    std::string end_key;
    size_t limit = 100;
    bool descending = false;
    size_t skip = 0;

    bool operator==(const RangeScan& o) const {
        return start_key == o.start_key && end_key == o.end_key && limit == o.limit &&
               descending == o.descending && skip == o.skip;
    }
};

using CompiledQuery = std::variant<PointGet, BatchGet, SelectorQuery, RangeScan>;

/// Canonical JSON rendering, e.g. {"kind":"range_scan","start_key":...}
nlohmann::json toJson(const CompiledQuery& query);

const char* kindName(const CompiledQuery& query);

enum class ValidationErrorCode {
    UnsupportedOperator,
    PlaceholderOutOfRange,
    MalformedPredicate,
    InvalidPrimaryKey
};

const char* validationErrorCodeName(ValidationErrorCode code);

struct ValidationError {
    ValidationErrorCode code = ValidationErrorCode::MalformedPredicate;
    std::string message;
};

struct CompileResult {
    bool success = false;
    ValidationError error;
    CompiledQuery query;

    static CompileResult Success(CompiledQuery q) {
        CompileResult r;
        r.success = true;
        r.query = std::move(q);
        return r;
    }

    static CompileResult Error(ValidationErrorCode code, std::string msg) {
        CompileResult r;
        r.success = false;
        r.error = ValidationError{code, std::move(msg)};
        return r;
    }
};

} // namespace query
} // namespace docbridge
