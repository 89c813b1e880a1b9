#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/compiled_query.h"
#include "query/predicate.h"
#include "schema/schema.h"

namespace docbridge {
namespace query {

/// Relational-style read request against one schema
struct QueryRequest {
    std::optional<Predicate> where;            // nullopt = whole collection
    std::vector<nlohmann::json> params;        // positional placeholder values
    std::vector<std::string> projection;       // Mango "fields"
    std::vector<SortField> order;
    std::optional<size_t> limit;
    std::optional<size_t> skip;
};

/**
 * Compiles a QueryRequest into a store directive
 *
 * Decision order:
 *   1. single Eq on the primary key, scalar value      -> PointGet
 *   2. single Eq/In on the primary key, list value     -> BatchGet
 *   3. no predicate                                    -> RangeScan [ns, ns + "/{}"]
 *   4. anything else                                   -> SelectorQuery {"type": ns, ...}
 *
 * Example:
 *   email == "a@b.com" in namespace "user"
 *
 * Compiles to:
 *   SelectorQuery { selector: {"type": "user", "email": "a@b.com"} }
 *
 * Pure and deterministic; errors are returned, never thrown.
 */
class QueryCompiler {
public:
    static constexpr size_t DEFAULT_SCAN_LIMIT = 100;

    static CompileResult compile(const SchemaDefinition& schema,
                                 const QueryRequest& request,
                                 size_t default_limit = DEFAULT_SCAN_LIMIT);

    /// Mango operator for a relational operator token, nullopt if unsupported
    static std::optional<std::string> mangoOperator(std::string_view op);

private:
    static std::optional<CompileResult> tryKeyLookup_(const SchemaDefinition& schema,
                                                      const QueryRequest& request);

    static CompileResult compileRangeScan_(const SchemaDefinition& schema,
                                           const QueryRequest& request,
                                           size_t default_limit);

    static CompileResult compileSelector_(const SchemaDefinition& schema,
                                          const QueryRequest& request);
};

} // namespace query
} // namespace docbridge
