#include "constraint/constraint_engine.h"
#include "schema/namespacer.h"
#include "utils/errors.h"
#include "utils/logger.h"

namespace docbridge {

using nlohmann::json;

namespace {

// Feldwert als Text: Strings roh, alles andere als JSON
std::string valueText(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

bool isPresent(const json& fields, const std::string& name) {
    if (!fields.is_object()) return false;
    auto it = fields.find(name);
    return it != fields.end() && !it->is_null();
}

// Primaerschluessel: Alias-Wert, sonst lokale id aus "_id"
std::optional<json> keyValue(const SchemaDefinition& schema, const json& fields, const std::string& name) {
    if (isPresent(fields, name)) {
        if (name == "_id" && fields[name].is_string()) {
            return json(Namespacer::unqualify(schema.ns, fields[name].get<std::string>()));
        }
        return fields[name];
    }
    if (schema.isPrimaryKey(name) && isPresent(fields, "_id") && fields["_id"].is_string()) {
        return json(Namespacer::unqualify(schema.ns, fields["_id"].get<std::string>()));
    }
    return std::nullopt;
}

} // namespace

const char* constraintKindName(ConstraintKind kind) {
    switch (kind) {
        case ConstraintKind::Unique: return "unique";
        case ConstraintKind::ForeignKey: return "foreign_key";
    }
    return "unique";
}

std::vector<std::string> ConstraintEngine::uniqueFields(const UniqueConstraint& constraint) {
    if (!constraint.fields.empty()) return constraint.fields;
    return uniqueFieldsFromName(constraint.name);
}

std::optional<std::string> ConstraintEngine::tryMarkerId_(const SchemaDefinition& schema,
                                                          const UniqueConstraint& constraint,
                                                          const json& fields) {
    auto names = uniqueFields(constraint);
    if (names.empty()) return std::nullopt;

    std::string id = schema.source();
    for (const auto& name : names) {
        auto value = keyValue(schema, fields, name);
        if (!value) return std::nullopt;
        id += "-";
        id += valueText(*value);
    }
    return id;
}

std::string ConstraintEngine::markerId(const SchemaDefinition& schema,
                                       const UniqueConstraint& constraint,
                                       const json& fields) {
    auto names = uniqueFields(constraint);
    if (names.empty()) {
        throw ConfigurationError(schema.type_name,
            "unique constraint '" + constraint.name + "' requires field names separated by \"-\"");
    }
    auto id = tryMarkerId_(schema, constraint, fields);
    if (!id) {
        throw ConfigurationError(schema.type_name,
            "all unique fields of '" + constraint.name + "' are required");
    }
    return *id;
}

std::vector<std::string> ConstraintEngine::markersOf(const SchemaDefinition& schema, const json& doc) {
    std::vector<std::string> markers;
    for (const auto& uc : schema.constraints.unique) {
        if (auto id = tryMarkerId_(schema, uc, doc)) markers.push_back(std::move(*id));
    }
    return markers;
}

std::vector<ConstraintResult> ConstraintEngine::validate(DocumentStore& store,
                                                         const SchemaDefinition& schema,
                                                         const json& new_fields,
                                                         const json* prev_fields) {
    json effective = json::object();
    if (prev_fields && prev_fields->is_object()) effective = *prev_fields;
    if (new_fields.is_object()) effective.update(new_fields);

    std::vector<ConstraintResult> results;
    results.reserve(schema.constraints.unique.size() + schema.constraints.foreign_keys.size());

    for (const auto& uc : schema.constraints.unique) {
        results.push_back(checkUnique_(store, schema, uc, effective, prev_fields));
    }
    for (const auto& fk : schema.constraints.foreign_keys) {
        results.push_back(checkForeignKey_(store, fk, effective));
    }
    return results;
}

ConstraintResult ConstraintEngine::checkUnique_(DocumentStore& store,
                                                const SchemaDefinition& schema,
                                                const UniqueConstraint& constraint,
                                                const json& effective,
                                                const json* prev_fields) {
    std::string marker = markerId(schema, constraint, effective);

    // Unveränderter Schlüssel beim Update: Marker gehört bereits diesem Dokument
    if (prev_fields) {
        auto previous = tryMarkerId_(schema, constraint, *prev_fields);
        if (previous && *previous == marker) {
            return ConstraintResult::Ok(ConstraintKind::Unique, constraint.name);
        }
    }

    auto [st, doc] = store.get(Namespacer::encodeForTransport(marker));
    if (st.ok()) return ConstraintResult::Invalid(ConstraintKind::Unique, constraint.name, marker);
    if (st.isNotFound()) return ConstraintResult::Pending(constraint.name, marker);

    DOCBRIDGE_ERROR("ConstraintEngine: lookup of marker {} failed: {}", marker, st.message);
    return ConstraintResult::Error(ConstraintKind::Unique, constraint.name,
                                   std::string(st.errorName()) + " :: " + st.message);
}

ConstraintResult ConstraintEngine::checkForeignKey_(DocumentStore& store,
                                                    const ForeignKeyConstraint& constraint,
                                                    const json& effective) {
    if (!isPresent(effective, constraint.field)) {
        return ConstraintResult::Ok(ConstraintKind::ForeignKey, constraint.name);
    }

    std::string ref = valueText(effective[constraint.field]);
    if (!constraint.target.empty()) ref = Namespacer::qualify(constraint.target, ref);

    auto [st, doc] = store.get(Namespacer::encodeForTransport(ref));
    if (st.ok()) return ConstraintResult::Ok(ConstraintKind::ForeignKey, constraint.name);
    if (st.isNotFound()) return ConstraintResult::Invalid(ConstraintKind::ForeignKey, constraint.name, ref);

    DOCBRIDGE_ERROR("ConstraintEngine: lookup of reference {} failed: {}", ref, st.message);
    return ConstraintResult::Error(ConstraintKind::ForeignKey, constraint.name,
                                   std::string(st.errorName()) + " :: " + st.message);
}

ConstraintVerdict ConstraintEngine::merge(const std::vector<ConstraintResult>& results) {
    ConstraintVerdict verdict;
    for (const auto& r : results) {
        switch (r.state) {
            case ConstraintResult::State::Ok:
                break;
            case ConstraintResult::State::OkPending:
                verdict.pending.push_back(PendingMarker{r.constraint, r.id});
                break;
            case ConstraintResult::State::Invalid:
                DOCBRIDGE_WARN("Constraint violation: {} '{}' ({})", constraintKindName(r.kind), r.constraint, r.id);
                verdict.violations.push_back(ConstraintViolation{r.kind, r.constraint, r.id});
                break;
            case ConstraintResult::State::Error:
                verdict.errors.push_back(r.reason);
                break;
        }
    }
    return verdict;
}

ConstraintVerdict ConstraintEngine::reserve(DocumentStore& store, const ConstraintVerdict& verdict) {
    ConstraintVerdict out;
    if (!verdict.ok()) {
        out.violations = verdict.violations;
        out.errors = verdict.errors;
        return out;
    }

    std::vector<std::string> reserved;
    for (const auto& p : verdict.pending) {
        json marker_doc = {{"_id", p.marker_id}, {"type", MARKER_TYPE}};
        auto [st, res] = store.put(Namespacer::encodeForTransport(p.marker_id), marker_doc, std::nullopt);
        if (st.ok()) {
            reserved.push_back(p.marker_id);
            out.pending.push_back(p);
            continue;
        }

        if (st.isConflict()) {
            DOCBRIDGE_WARN("Constraint violation: unique '{}' ({}) taken concurrently", p.constraint, p.marker_id);
            out.violations.push_back(ConstraintViolation{ConstraintKind::Unique, p.constraint, p.marker_id});
        } else {
            DOCBRIDGE_ERROR("ConstraintEngine: reserving marker {} failed: {}", p.marker_id, st.message);
            out.errors.push_back(std::string(st.errorName()) + " :: " + st.message);
        }
        release(store, reserved);
        out.pending.clear();
        return out;
    }
    return out;
}

void ConstraintEngine::release(DocumentStore& store, const std::vector<std::string>& marker_ids) {
    for (const auto& marker : marker_ids) {
        std::string encoded = Namespacer::encodeForTransport(marker);
        auto [st, doc] = store.get(encoded);
        if (st.isNotFound()) continue;
        if (!st.ok()) {
            DOCBRIDGE_WARN("ConstraintEngine: cannot release marker {}: {}", marker, st.message);
            continue;
        }
        StoreStatus rm = store.remove(encoded, doc.value("_rev", ""));
        if (!rm.ok() && !rm.isNotFound()) {
            DOCBRIDGE_WARN("ConstraintEngine: cannot release marker {}: {}", marker, rm.message);
        }
    }
}

} // namespace docbridge
