#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "schema/schema.h"

namespace docbridge {
namespace query {

/// Primary-key alias of a schema: the field reads the local part of "_id"
struct KeyAlias {
    std::string field;
    std::string ns;
};

/// Fixed-arity result rows plus their count
struct ProjectionResult {
    size_t count = 0;
    std::vector<std::vector<nlohmann::json>> rows;
};

/**
 * Shapes raw store responses into rows of exactly fields.size() values.
 *
 * Accepted shapes:
 *   null, [], {"rows": []}, {"docs": []}      -> (0, [])
 *   {"rows": [{"doc": {...}}, ...]}            -> one row per document
 *   {"docs": [...]} or [...]                   -> one row per element
 *   {"doc": {...}} or a single document        -> (1, [row])
 *   {"error": ..., "reason": ...}              -> throws StoreError
 *
 * With field_meta, missing fields get the zero value of their declared type
 * (null if undeclared). Without it, the static default or null.
 * With key_alias, the alias field yields the unqualified "_id".
 */
class ResultProjector {
public:
    static ProjectionResult project(const nlohmann::json& raw,
                                    const std::vector<std::string>& fields,
                                    const FieldMeta* field_meta = nullptr,
                                    const FieldDefaults* defaults = nullptr,
                                    const KeyAlias* key_alias = nullptr);

    /// Single document -> one row
    static std::vector<nlohmann::json> projectDocument(const nlohmann::json& doc,
                                                       const std::vector<std::string>& fields,
                                                       const FieldMeta* field_meta = nullptr,
                                                       const FieldDefaults* defaults = nullptr,
                                    const KeyAlias* key_alias = nullptr);

    static bool isErrorPayload(const nlohmann::json& raw);
};

} // namespace query
} // namespace docbridge
