#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/compiled_query.h"
#include "query/query_compiler.h"
#include "query/result_projector.h"
#include "schema/schema.h"
#include "storage/document_store.h"

namespace docbridge {
namespace query {

struct ExecutionResult {
    bool success = false;
    ValidationError error;          // nur bei !success
    size_t count = 0;
    std::vector<std::vector<nlohmann::json>> rows;
};

/// Runs compiled queries against a store session and shapes the response
class QueryExecutor {
public:
    /// Raw store response for one directive. A missing PointGet target yields [].
    /// Store failures throw StoreError.
    static nlohmann::json fetch(DocumentStore& store, const CompiledQuery& query);

    /// compile + fetch + project. fields empty -> the schema's declared fields.
    /// typed: synthesize zero values for missing declared fields.
    static ExecutionResult all(DocumentStore& store,
                               const SchemaDefinition& schema,
                               const QueryRequest& request,
                               std::vector<std::string> fields = {},
                               bool typed = true,
                               size_t default_limit = QueryCompiler::DEFAULT_SCAN_LIMIT);
};

} // namespace query
} // namespace docbridge
