#include "query/query_executor.h"
#include "schema/namespacer.h"
#include "utils/errors.h"
#include "utils/logger.h"

namespace docbridge {
namespace query {

using nlohmann::json;

namespace {

[[noreturn]] void throwStoreError(const StoreStatus& st, const std::string& what) {
    DOCBRIDGE_ERROR("QueryExecutor: {} failed: {}", what, st.message);
    throw StoreError(st.errorName(), st.message);
}

} // namespace

json QueryExecutor::fetch(DocumentStore& store, const CompiledQuery& query) {
    return std::visit([&store](const auto& q) -> json {
        using T = std::decay_t<decltype(q)>;
        if constexpr (std::is_same_v<T, PointGet>) {
            auto [st, doc] = store.get(Namespacer::encodeForTransport(q.id));
            if (st.isNotFound()) return json::array();
            if (!st.ok()) throwStoreError(st, "get " + q.id);
            return doc;
        } else if constexpr (std::is_same_v<T, BatchGet>) {
            auto [st, body] = store.allDocs(q.ids, true);
            if (!st.ok()) throwStoreError(st, "batch get");
            return body;
        } else if constexpr (std::is_same_v<T, SelectorQuery>) {
            auto [st, body] = store.find(q.selector, q.options);
            if (!st.ok()) throwStoreError(st, "find");
            return body;
        } else {
            RangeScanOptions opts;
            opts.start_key = q.start_key;
            opts.end_key = q.end_key;
            opts.limit = q.limit;
            opts.skip = q.skip;
            opts.descending = q.descending;
            opts.include_docs = true;
            auto [st, body] = store.rangeScan(opts);
            if (!st.ok()) throwStoreError(st, "range scan");
            return body;
        }
    }, query);
}

ExecutionResult QueryExecutor::all(DocumentStore& store,
                                   const SchemaDefinition& schema,
                                   const QueryRequest& request,
                                   std::vector<std::string> fields,
                                   bool typed,
                                   size_t default_limit) {
    ExecutionResult result;

    auto compiled = QueryCompiler::compile(schema, request, default_limit);
    if (!compiled.success) {
        result.error = compiled.error;
        return result;
    }

    if (fields.empty()) fields = request.projection.empty() ? schema.fieldNames() : request.projection;

    // Untergrenze "ns" schließt auch Marker-Dokumente "ns-..." ein ('-' < '/')
    if (auto* scan = std::get_if<RangeScan>(&compiled.query)) {
        std::string& lower = scan->descending ? scan->end_key : scan->start_key;
        if (lower == Namespacer::scanStartKey(schema.ns)) lower = Namespacer::qualify(schema.ns, "");
    }

    json raw = fetch(store, compiled.query);

    FieldMeta meta;
    if (typed) meta = schema.fieldMeta();
    KeyAlias alias{schema.primary_key, schema.ns};
    const bool has_alias = schema.primary_key != "_id";
    auto projected = ResultProjector::project(raw, fields, typed ? &meta : nullptr, nullptr,
                                              has_alias ? &alias : nullptr);

    result.success = true;
    result.count = projected.count;
    result.rows = std::move(projected.rows);
    return result;
}

} // namespace query
} // namespace docbridge
