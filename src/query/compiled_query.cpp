#include "query/compiled_query.h"

namespace docbridge {
namespace query {

using nlohmann::json;

namespace {

json optionsToJson(const FindOptions& options) {
    json out = json::object();
    if (options.limit) out["limit"] = *options.limit;
    if (options.skip) out["skip"] = *options.skip;
    if (!options.sort.empty()) {
        json sort = json::array();
        for (const auto& s : options.sort) {
            sort.push_back(json{{s.field, s.direction == SortDirection::Desc ? "desc" : "asc"}});
        }
        out["sort"] = std::move(sort);
    }
    if (!options.fields.empty()) out["fields"] = options.fields;
    return out;
}

} // namespace

json toJson(const CompiledQuery& query) {
    return std::visit([](const auto& q) -> json {
        using T = std::decay_t<decltype(q)>;
        if constexpr (std::is_same_v<T, PointGet>) {
            return {{"kind", "point_get"}, {"id", q.id}};
        } else if constexpr (std::is_same_v<T, BatchGet>) {
            return {{"kind", "batch_get"}, {"ids", q.ids}};
        } else if constexpr (std::is_same_v<T, SelectorQuery>) {
            json out = optionsToJson(q.options);
            out["kind"] = "selector";
            out["selector"] = q.selector;
            return out;
        } else {
            return {
                {"kind", "range_scan"},
                {"start_key", q.start_key},
                {"end_key", q.end_key},
                {"limit", q.limit},
                {"skip", q.skip},
                {"descending", q.descending}
            };
        }
    }, query);
}

const char* kindName(const CompiledQuery& query) {
    switch (query.index()) {
        case 0: return "point_get";
        case 1: return "batch_get";
        case 2: return "selector";
        default: return "range_scan";
    }
}

const char* validationErrorCodeName(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::UnsupportedOperator: return "unsupported_operator";
        case ValidationErrorCode::PlaceholderOutOfRange: return "placeholder_out_of_range";
        case ValidationErrorCode::MalformedPredicate: return "malformed_predicate";
        case ValidationErrorCode::InvalidPrimaryKey: return "invalid_primary_key";
    }
    return "unknown";
}

} // namespace query
} // namespace docbridge
