#include "query/query_compiler.h"
#include "schema/namespacer.h"
#include "utils/logger.h"

#include <algorithm>
#include <array>
#include <utility>

namespace docbridge {
namespace query {

using nlohmann::json;

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 7> kOperatorTable{{
    {"==", "$eq"},
    {">", "$gt"},
    {"<", "$lt"},
    {">=", "$gte"},
    {"<=", "$lte"},
    {"!=", "$ne"},
    {"in", "$in"},
}};

struct Failure {
    ValidationErrorCode code;
    std::string message;
};

bool isOperatorMap(const json& v) {
    if (!v.is_object() || v.empty()) return false;
    for (auto it = v.begin(); it != v.end(); ++it) {
        if (it.key().empty() || it.key()[0] != '$') return false;
    }
    return true;
}

/// Merges a translated child into an AND-level selector map.
/// Operator maps on the same field are combined; any other collision goes into "$and".
void mergeFragment(json& target, const json& fragment) {
    for (auto it = fragment.begin(); it != fragment.end(); ++it) {
        const std::string& key = it.key();
        auto existing = target.find(key);
        if (existing == target.end()) {
            target[key] = it.value();
            continue;
        }
        if (key == "$and" && existing->is_array() && it.value().is_array()) {
            for (const auto& clause : it.value()) existing->push_back(clause);
            continue;
        }
        if (isOperatorMap(*existing) && isOperatorMap(it.value())) {
            bool disjoint = true;
            for (auto op = it.value().begin(); op != it.value().end(); ++op) {
                if (existing->contains(op.key())) { disjoint = false; break; }
            }
            if (disjoint) {
                for (auto op = it.value().begin(); op != it.value().end(); ++op) {
                    (*existing)[op.key()] = op.value();
                }
                continue;
            }
        }
        json& conj = target["$and"];
        if (!conj.is_array()) conj = json::array();
        conj.push_back(json{{key, it.value()}});
    }
}

std::optional<std::string> idToString(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer() || v.is_number_unsigned()) return v.dump();
    if (v.is_number_float()) return v.dump();
    return std::nullopt;
}

/// Recursive translation of one predicate tree; the first failure wins
class Translator {
public:
    Translator(const SchemaDefinition& schema, const std::vector<json>& params)
        : schema_(schema), params_(params) {}

    const std::optional<Failure>& failure() const { return failure_; }

    std::optional<json> resolve(const Operand& operand) {
        if (const auto* literal = std::get_if<json>(&operand)) return *literal;
        const auto& ph = std::get<Placeholder>(operand);
        if (ph.index >= params_.size()) {
            fail(ValidationErrorCode::PlaceholderOutOfRange,
                 "placeholder ^" + std::to_string(ph.index) + " out of range (" +
                 std::to_string(params_.size()) + " parameters)");
            return std::nullopt;
        }
        return params_[ph.index];
    }

    /// Resolve a value list, splicing placeholders that resolve to lists
    std::optional<json> resolveList(const std::vector<Operand>& operands) {
        json out = json::array();
        for (const auto& operand : operands) {
            auto v = resolve(operand);
            if (!v) return std::nullopt;
            if (v->is_array() && std::holds_alternative<Placeholder>(operand)) {
                for (auto& item : *v) out.push_back(std::move(item));
            } else {
                out.push_back(std::move(*v));
            }
        }
        return out;
    }

    std::optional<std::string> qualifiedId(const json& v) {
        auto raw = idToString(v);
        if (!raw) {
            fail(ValidationErrorCode::InvalidPrimaryKey, "primary key must be a string or number, got " + v.dump());
            return std::nullopt;
        }
        return Namespacer::qualify(schema_.ns, *raw);
    }

    std::optional<json> qualifiedIds(const json& list) {
        json out = json::array();
        for (const auto& v : list) {
            auto id = qualifiedId(v);
            if (!id) return std::nullopt;
            out.push_back(*id);
        }
        return out;
    }

    std::optional<json> translate(const Predicate& p) {
        return std::visit([this](const auto& node) -> std::optional<json> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Predicate::Eq>) {
                auto v = resolve(node.value);
                if (!v) return std::nullopt;
                return translateEq(node.field, *v);
            } else if constexpr (std::is_same_v<T, Predicate::Cmp>) {
                return translateCmp(node);
            } else if constexpr (std::is_same_v<T, Predicate::In>) {
                auto values = resolveList(node.values);
                if (!values) return std::nullopt;
                return translateIn(node.field, *values);
            } else if constexpr (std::is_same_v<T, Predicate::And>) {
                if (node.children.empty()) {
                    fail(ValidationErrorCode::MalformedPredicate, "AND without operands");
                    return std::nullopt;
                }
                json merged = json::object();
                for (const auto& child : node.children) {
                    auto fragment = translate(child);
                    if (!fragment) return std::nullopt;
                    mergeFragment(merged, *fragment);
                }
                return merged;
            } else if constexpr (std::is_same_v<T, Predicate::Or>) {
                if (node.children.empty()) {
                    fail(ValidationErrorCode::MalformedPredicate, "OR without operands");
                    return std::nullopt;
                }
                json alternatives = json::array();
                for (const auto& child : node.children) {
                    auto fragment = translate(child);
                    if (!fragment) return std::nullopt;
                    alternatives.push_back(std::move(*fragment));
                }
                return json{{"$or", std::move(alternatives)}};
            } else {
                auto v = resolve(node.placeholder);
                if (!v) return std::nullopt;
                if (!v->is_object()) {
                    fail(ValidationErrorCode::MalformedPredicate,
                         "parameter ^" + std::to_string(node.placeholder.index) + " is not a selector object");
                    return std::nullopt;
                }
                return *v;
            }
        }, p.node);
    }

private:
    std::optional<json> translateEq(const std::string& field, const json& value) {
        if (schema_.isPrimaryKey(field)) {
            if (value.is_array()) {
                auto ids = qualifiedIds(value);
                if (!ids) return std::nullopt;
                return json{{"_id", {{"$in", std::move(*ids)}}}};
            }
            auto id = qualifiedId(value);
            if (!id) return std::nullopt;
            return json{{"_id", *id}};
        }
        // Objekt-Literale explizit mit $eq, sonst wären sie von Operator-Maps nicht unterscheidbar
        if (value.is_object()) return json{{field, {{"$eq", value}}}};
        return json{{field, value}};
    }

    std::optional<json> translateIn(const std::string& field, const json& values) {
        if (!values.is_array()) {
            fail(ValidationErrorCode::MalformedPredicate, "IN on '" + field + "' requires a list value");
            return std::nullopt;
        }
        if (schema_.isPrimaryKey(field)) {
            auto ids = qualifiedIds(values);
            if (!ids) return std::nullopt;
            return json{{"_id", {{"$in", std::move(*ids)}}}};
        }
        return json{{field, {{"$in", values}}}};
    }

    std::optional<json> translateCmp(const Predicate::Cmp& node) {
        auto mango = QueryCompiler::mangoOperator(node.op);
        if (!mango) {
            fail(ValidationErrorCode::UnsupportedOperator, "unsupported operator '" + node.op + "'");
            return std::nullopt;
        }
        auto v = resolve(node.value);
        if (!v) return std::nullopt;
        if (node.op == "==") return translateEq(node.field, *v);
        if (node.op == "in") return translateIn(node.field, *v);

        if (schema_.isPrimaryKey(node.field)) {
            auto id = qualifiedId(*v);
            if (!id) return std::nullopt;
            return json{{"_id", {{*mango, *id}}}};
        }
        return json{{node.field, {{*mango, *v}}}};
    }

    void fail(ValidationErrorCode code, std::string message) {
        if (!failure_) failure_ = Failure{code, std::move(message)};
    }

    const SchemaDefinition& schema_;
    const std::vector<json>& params_;
    std::optional<Failure> failure_;
};

CompileResult fromFailure(const Failure& f) {
    return CompileResult::Error(f.code, f.message);
}

} // namespace

std::optional<std::string> QueryCompiler::mangoOperator(std::string_view op) {
    for (const auto& [token, mango] : kOperatorTable) {
        if (token == op) return std::string(mango);
    }
    return std::nullopt;
}

CompileResult QueryCompiler::compile(const SchemaDefinition& schema,
                                     const QueryRequest& request,
                                     size_t default_limit) {
    CompileResult result;
    if (!request.where) {
        result = compileRangeScan_(schema, request, default_limit);
    } else if (auto lookup = tryKeyLookup_(schema, request)) {
        result = std::move(*lookup);
    } else {
        result = compileSelector_(schema, request);
    }

    if (result.success) {
        DOCBRIDGE_DEBUG("QueryCompiler: {} -> {}", schema.ns, kindName(result.query));
    } else {
        DOCBRIDGE_DEBUG("QueryCompiler: {} rejected ({}): {}", schema.ns,
                        validationErrorCodeName(result.error.code), result.error.message);
    }
    return result;
}

std::optional<CompileResult> QueryCompiler::tryKeyLookup_(const SchemaDefinition& schema,
                                                          const QueryRequest& request) {
    const Predicate& where = *request.where;
    Translator tr(schema, request.params);

    // Welche Knoten kommen als Schlüsselzugriff in Frage?
    const Operand* scalarOrList = nullptr;
    const std::vector<Operand>* list = nullptr;
    if (const auto* eq = std::get_if<Predicate::Eq>(&where.node)) {
        if (!schema.isPrimaryKey(eq->field)) return std::nullopt;
        scalarOrList = &eq->value;
    } else if (const auto* cmp = std::get_if<Predicate::Cmp>(&where.node)) {
        if (!schema.isPrimaryKey(cmp->field)) return std::nullopt;
        if (cmp->op != "==" && cmp->op != "in") return std::nullopt;
        scalarOrList = &cmp->value;
    } else if (const auto* in = std::get_if<Predicate::In>(&where.node)) {
        if (!schema.isPrimaryKey(in->field)) return std::nullopt;
        list = &in->values;
    } else {
        return std::nullopt;
    }

    json value;
    if (scalarOrList) {
        auto v = tr.resolve(*scalarOrList);
        if (!v) return fromFailure(*tr.failure());
        value = std::move(*v);
    } else {
        auto v = tr.resolveList(*list);
        if (!v) return fromFailure(*tr.failure());
        value = std::move(*v);
    }

    if (!value.is_array()) {
        if (list) {
            return CompileResult::Error(ValidationErrorCode::MalformedPredicate, "IN requires a list value");
        }
        if (const auto* cmp = std::get_if<Predicate::Cmp>(&where.node); cmp && cmp->op == "in") {
            return CompileResult::Error(ValidationErrorCode::MalformedPredicate, "IN requires a list value");
        }
        auto id = tr.qualifiedId(value);
        if (!id) return fromFailure(*tr.failure());
        return CompileResult::Success(PointGet{std::move(*id)});
    }

    BatchGet batch;
    batch.ids.reserve(value.size());
    for (const auto& v : value) {
        auto id = tr.qualifiedId(v);
        if (!id) return fromFailure(*tr.failure());
        batch.ids.push_back(std::move(*id));
    }
    return CompileResult::Success(std::move(batch));
}

CompileResult QueryCompiler::compileRangeScan_(const SchemaDefinition& schema,
                                               const QueryRequest& request,
                                               size_t default_limit) {
    RangeScan scan;
    scan.start_key = Namespacer::scanStartKey(schema.ns);
    scan.end_key = Namespacer::scanEndKey(schema.ns);
    scan.limit = request.limit.value_or(default_limit);
    scan.skip = request.skip.value_or(0);

    // Absteigende Reihenfolge: Schlüsselbereich rückwärts traversieren, Grenzen tauschen
    if (!request.order.empty() && request.order.front().direction == SortDirection::Desc) {
        std::swap(scan.start_key, scan.end_key);
        scan.descending = true;
    }
    return CompileResult::Success(std::move(scan));
}

CompileResult QueryCompiler::compileSelector_(const SchemaDefinition& schema,
                                              const QueryRequest& request) {
    Translator tr(schema, request.params);
    auto fragment = tr.translate(*request.where);
    if (!fragment) return fromFailure(*tr.failure());

    SelectorQuery q;
    q.selector = json{{"type", schema.ns}};
    mergeFragment(q.selector, *fragment);

    q.options.limit = request.limit;
    q.options.skip = request.skip;
    // Primärschlüssel-Alias wird im Dokument als "_id" gespeichert
    q.options.sort = request.order;
    for (auto& s : q.options.sort) {
        if (schema.isPrimaryKey(s.field)) s.field = "_id";
    }
    for (const auto& f : request.projection) {
        std::string name = schema.isPrimaryKey(f) ? "_id" : f;
        if (std::find(q.options.fields.begin(), q.options.fields.end(), name) == q.options.fields.end()) {
            q.options.fields.push_back(std::move(name));
        }
    }
    return CompileResult::Success(std::move(q));
}

} // namespace query
} // namespace docbridge
