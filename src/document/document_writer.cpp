#include "document/document_writer.h"
#include "schema/namespacer.h"
#include "utils/id_generator.h"
#include "utils/logger.h"

#include <algorithm>

namespace docbridge {
namespace document {

namespace {

std::string storeError(const StoreStatus& st) {
    return std::string(st.errorName()) + " :: " + st.message;
}

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}

std::string idText(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

} // namespace

json DocumentWriter::prepareInsert_(const SchemaDefinition& schema, const json& fields) {
    json doc = fields;

    std::string local;
    if (schema.primary_key != "_id" && doc.contains(schema.primary_key) && !doc[schema.primary_key].is_null()) {
        local = idText(doc[schema.primary_key]);
        doc.erase(schema.primary_key);
    } else if (doc.contains("_id") && !doc["_id"].is_null()) {
        local = idText(doc["_id"]);
    } else {
        local = utils::generateUuid();
    }

    doc.erase("_rev");
    doc["_id"] = Namespacer::qualify(schema.ns, local);
    doc["type"] = schema.ns;
    return doc;
}

WriteOutcome DocumentWriter::checkAndReserve_(DocumentStore& store,
                                              const SchemaDefinition& schema,
                                              const json& fields,
                                              const json* prev,
                                              std::vector<std::string>& reserved) {
    auto verdict = ConstraintEngine::merge(ConstraintEngine::validate(store, schema, fields, prev));
    return reserveVerdict_(store, std::move(verdict), reserved);
}

WriteOutcome DocumentWriter::reserveVerdict_(DocumentStore& store,
                                             ConstraintVerdict verdict,
                                             std::vector<std::string>& reserved) {
    if (!verdict.violations.empty()) return WriteOutcome::Invalid(std::move(verdict.violations));
    if (!verdict.errors.empty()) return WriteOutcome::Error(joinErrors(verdict.errors));

    auto reservation = ConstraintEngine::reserve(store, verdict);
    if (!reservation.violations.empty()) return WriteOutcome::Invalid(std::move(reservation.violations));
    if (!reservation.errors.empty()) return WriteOutcome::Error(joinErrors(reservation.errors));

    for (const auto& p : reservation.pending) reserved.push_back(p.marker_id);
    return WriteOutcome{};
}

WriteOutcome DocumentWriter::insert(DocumentStore& store,
                                    const SchemaDefinition& schema,
                                    const json& fields,
                                    const std::vector<std::string>& returning) {
    if (!fields.is_object()) return WriteOutcome::Error("bad_request :: document must be an object");

    json doc = prepareInsert_(schema, fields);
    const std::string id = doc["_id"].get<std::string>();

    std::vector<std::string> reserved;
    WriteOutcome check = checkAndReserve_(store, schema, doc, nullptr, reserved);
    if (!check.ok()) return check;

    auto [st, res] = store.put(Namespacer::encodeForTransport(id), doc, std::nullopt);
    if (!st.ok()) {
        DOCBRIDGE_ERROR("DocumentWriter: insert of {} failed: {}", id, st.message);
        ConstraintEngine::release(store, reserved);
        return WriteOutcome::Error(storeError(st));
    }

    doc["_rev"] = res.rev;
    WriteOutcome out;
    out.id = id;
    out.rev = res.rev;
    out.values = mapReturning(schema, doc, returning);
    DOCBRIDGE_DEBUG("DocumentWriter: inserted {} rev {}", id, res.rev);
    return out;
}

WriteOutcome DocumentWriter::update(DocumentStore& store,
                                    const SchemaDefinition& schema,
                                    const std::string& id,
                                    const json& changes,
                                    const std::vector<std::string>& returning) {
    if (!changes.is_object()) return WriteOutcome::Error("bad_request :: changes must be an object");

    const std::string qid = Namespacer::qualify(schema.ns, id);
    const std::string encoded = Namespacer::encodeForTransport(qid);

    auto [get_st, current] = store.get(encoded);
    if (!get_st.ok()) return WriteOutcome::Error(storeError(get_st));

    json delta = changes;
    delta.erase("_id");
    delta.erase("_rev");
    if (schema.primary_key != "_id") delta.erase(schema.primary_key);

    std::vector<std::string> reserved;
    WriteOutcome check = checkAndReserve_(store, schema, delta, &current, reserved);
    if (!check.ok()) return check;

    json merged = current;
    merged.update(delta);
    std::optional<std::string> rev;
    if (current.contains("_rev") && current["_rev"].is_string()) rev = current["_rev"].get<std::string>();

    auto [st, res] = store.put(encoded, merged, rev);
    if (!st.ok()) {
        DOCBRIDGE_ERROR("DocumentWriter: update of {} failed: {}", qid, st.message);
        ConstraintEngine::release(store, reserved);
        return WriteOutcome::Error(storeError(st));
    }

    // Marker des alten Schlüssels freigeben
    auto before = ConstraintEngine::markersOf(schema, current);
    auto after = ConstraintEngine::markersOf(schema, merged);
    std::vector<std::string> stale;
    for (const auto& m : before) {
        if (std::find(after.begin(), after.end(), m) == after.end()) stale.push_back(m);
    }
    ConstraintEngine::release(store, stale);

    merged["_rev"] = res.rev;
    WriteOutcome out;
    out.id = qid;
    out.rev = res.rev;
    out.values = mapReturning(schema, merged, returning);
    return out;
}

std::vector<WriteOutcome> DocumentWriter::bulkInsert(DocumentStore& store,
                                                     const SchemaDefinition& schema,
                                                     const std::vector<json>& items,
                                                     const std::vector<std::string>& returning) {
    std::vector<WriteOutcome> outcomes(items.size());
    std::vector<json> batch;
    std::vector<size_t> batch_index;                 // Position im Input
    std::vector<std::vector<std::string>> batch_markers;

    // Phase 1: alle Items pruefen, bevor ein Marker geschrieben wird.
    // Ein ConfigurationError bricht hier ab, ohne Marker zu hinterlassen.
    std::vector<json> prepared(items.size());
    std::vector<ConstraintVerdict> verdicts(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (!items[i].is_object()) continue;
        prepared[i] = prepareInsert_(schema, items[i]);
        verdicts[i] = ConstraintEngine::merge(ConstraintEngine::validate(store, schema, prepared[i], nullptr));
    }

    // Phase 2: reservieren; Duplikate innerhalb des Batches verlieren hier
    for (size_t i = 0; i < items.size(); ++i) {
        if (!items[i].is_object()) {
            outcomes[i] = WriteOutcome::Error("bad_request :: document must be an object");
            continue;
        }
        json& doc = prepared[i];

        std::vector<std::string> reserved;
        WriteOutcome check = reserveVerdict_(store, std::move(verdicts[i]), reserved);
        if (!check.ok()) {
            check.id = doc["_id"].get<std::string>();
            outcomes[i] = std::move(check);
            continue;
        }
        batch_index.push_back(i);
        batch_markers.push_back(std::move(reserved));
        batch.push_back(std::move(doc));
    }

    if (batch.empty()) return outcomes;

    auto [st, results] = store.bulkPut(batch);
    if (!st.ok() || results.size() != batch.size()) {
        std::string err = st.ok() ? "store_error :: bulk response size mismatch" : storeError(st);
        DOCBRIDGE_ERROR("DocumentWriter: bulk insert failed: {}", err);
        for (size_t k = 0; k < batch.size(); ++k) {
            ConstraintEngine::release(store, batch_markers[k]);
            outcomes[batch_index[k]] = WriteOutcome::Error(err);
            outcomes[batch_index[k]].id = batch[k]["_id"].get<std::string>();
        }
        return outcomes;
    }

    for (size_t k = 0; k < batch.size(); ++k) {
        const auto& r = results[k];
        WriteOutcome& out = outcomes[batch_index[k]];
        if (!r.ok()) {
            ConstraintEngine::release(store, batch_markers[k]);
            out = WriteOutcome::Error(r.error + " :: " + r.reason);
            out.id = r.id;
            out.values = mapReturning(schema, json{{"_id", r.id}}, returning);
            continue;
        }
        json doc = batch[k];
        doc["_rev"] = *r.rev;
        out.id = r.id;
        out.rev = *r.rev;
        out.values = mapReturning(schema, doc, returning);
    }
    return outcomes;
}

WriteOutcome DocumentWriter::remove(DocumentStore& store,
                                    const SchemaDefinition& schema,
                                    const std::string& id) {
    const std::string qid = Namespacer::qualify(schema.ns, id);
    const std::string encoded = Namespacer::encodeForTransport(qid);

    auto [get_st, current] = store.get(encoded);
    if (!get_st.ok()) return WriteOutcome::Error(storeError(get_st));

    std::string rev = current.value("_rev", "");
    StoreStatus st = store.remove(encoded, rev);
    if (!st.ok()) {
        DOCBRIDGE_ERROR("DocumentWriter: delete of {} failed: {}", qid, st.message);
        return WriteOutcome::Error(storeError(st));
    }
    ConstraintEngine::release(store, ConstraintEngine::markersOf(schema, current));

    WriteOutcome out;
    out.id = qid;
    out.rev = rev;
    return out;
}

std::pair<StoreStatus, size_t> DocumentWriter::removeAll(DocumentStore& store,
                                                         const SchemaDefinition& schema,
                                                         size_t batch_size) {
    size_t deleted = 0;
    if (batch_size == 0) batch_size = DEFAULT_DELETE_BATCH;

    while (true) {
        RangeScanOptions scan;
        scan.start_key = Namespacer::qualify(schema.ns, "");
        scan.end_key = Namespacer::scanEndKey(schema.ns);
        scan.limit = batch_size;
        scan.include_docs = true;

        auto [st, page] = store.rangeScan(scan);
        if (!st.ok()) return {st, deleted};

        std::vector<json> tombstones;
        std::vector<json> docs;
        for (const auto& row : page.value("rows", json::array())) {
            if (!row.contains("doc") || !row["doc"].is_object()) continue;
            const json& doc = row["doc"];
            tombstones.push_back(json{{"_id", doc["_id"]}, {"_rev", doc["_rev"]}, {"_deleted", true}});
            docs.push_back(doc);
        }
        if (tombstones.empty()) break;

        auto [bulk_st, results] = store.bulkPut(tombstones);
        if (!bulk_st.ok()) return {bulk_st, deleted};

        size_t round = 0;
        for (size_t k = 0; k < results.size() && k < docs.size(); ++k) {
            if (!results[k].ok()) {
                DOCBRIDGE_WARN("DocumentWriter: delete of {} failed: {}", results[k].id, results[k].reason);
                continue;
            }
            ++round;
            ConstraintEngine::release(store, ConstraintEngine::markersOf(schema, docs[k]));
        }
        deleted += round;
        // Keine Fortschritte mehr: verbleibende Dokumente sind gesperrt oder im Konflikt
        if (round == 0 || tombstones.size() < batch_size) break;
    }

    DOCBRIDGE_INFO("DocumentWriter: deleted {} documents from {}", deleted, schema.ns);
    return {StoreStatus::OK(), deleted};
}

std::vector<std::pair<std::string, json>> DocumentWriter::mapReturning(const SchemaDefinition& schema,
                                                                       const json& doc,
                                                                       const std::vector<std::string>& returning) {
    std::vector<std::pair<std::string, json>> values;
    values.reserve(returning.size());
    for (const auto& name : returning) {
        const std::string key = schema.isPrimaryKey(name) ? "_id" : name;
        auto it = doc.find(key);
        values.emplace_back(name, it != doc.end() ? *it : json(nullptr));
    }
    return values;
}

} // namespace document
} // namespace docbridge
