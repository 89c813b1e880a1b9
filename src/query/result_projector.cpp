#include "query/result_projector.h"
#include "schema/namespacer.h"
#include "utils/errors.h"
#include "utils/logger.h"

namespace docbridge {
namespace query {

using nlohmann::json;

namespace {

std::string textOf(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "";
    return v.dump();
}

void appendRows(const json& docs, ProjectionResult& out,
                const std::vector<std::string>& fields,
                const FieldMeta* meta, const FieldDefaults* defaults,
                const KeyAlias* key_alias) {
    for (const auto& item : docs) {
        if (!item.is_object()) continue;
        out.rows.push_back(ResultProjector::projectDocument(item, fields, meta, defaults, key_alias));
    }
}

} // namespace

bool ResultProjector::isErrorPayload(const json& raw) {
    return raw.is_object() && raw.contains("error") && !raw.contains("_id");
}

ProjectionResult ResultProjector::project(const json& raw,
                                          const std::vector<std::string>& fields,
                                          const FieldMeta* field_meta,
                                          const FieldDefaults* defaults,
                                          const KeyAlias* key_alias) {
    ProjectionResult out;
    if (raw.is_null()) return out;

    if (isErrorPayload(raw)) {
        std::string error = textOf(raw["error"]);
        std::string reason = raw.contains("reason") ? textOf(raw["reason"]) : "";
        DOCBRIDGE_ERROR("ResultProjector: store error payload {} :: {}", error, reason);
        throw StoreError(error, reason);
    }

    if (raw.is_array()) {
        appendRows(raw, out, fields, field_meta, defaults, key_alias);
    } else if (raw.is_object() && raw.contains("rows") && raw["rows"].is_array()) {
        // Batch- und Range-Zeilen: "doc" auspacken, not_found-/geloeschte Eintraege verwerfen
        for (const auto& row : raw["rows"]) {
            if (!row.is_object() || row.contains("error")) continue;
            if (row.contains("doc")) {
                const json& doc = row["doc"];
                if (!doc.is_object()) continue;
                out.rows.push_back(projectDocument(doc, fields, field_meta, defaults, key_alias));
            } else {
                out.rows.push_back(projectDocument(row, fields, field_meta, defaults, key_alias));
            }
        }
    } else if (raw.is_object() && raw.contains("docs") && raw["docs"].is_array()) {
        appendRows(raw["docs"], out, fields, field_meta, defaults, key_alias);
    } else if (raw.is_object() && raw.contains("doc") && raw["doc"].is_object()) {
        out.rows.push_back(projectDocument(raw["doc"], fields, field_meta, defaults, key_alias));
    } else if (raw.is_object() && !raw.empty()) {
        out.rows.push_back(projectDocument(raw, fields, field_meta, defaults, key_alias));
    }

    out.count = out.rows.size();
    return out;
}

std::vector<json> ResultProjector::projectDocument(const json& doc,
                                                   const std::vector<std::string>& fields,
                                                   const FieldMeta* field_meta,
                                                   const FieldDefaults* defaults,
                                                   const KeyAlias* key_alias) {
    std::vector<json> row;
    row.reserve(fields.size());
    for (const auto& field : fields) {
        if (key_alias && field == key_alias->field) {
            auto id = doc.find("_id");
            if (id != doc.end() && id->is_string()) {
                row.push_back(Namespacer::unqualify(key_alias->ns, id->get<std::string>()));
                continue;
            }
        }
        auto it = doc.find(field);
        if (it != doc.end()) {
            row.push_back(*it);
            continue;
        }
        if (field_meta) {
            auto type = field_meta->find(field);
            row.push_back(type != field_meta->end() ? zeroValue(type->second) : json(nullptr));
        } else if (defaults) {
            auto def = defaults->find(field);
            row.push_back(def != defaults->end() ? def->second : json(nullptr));
        } else {
            row.push_back(nullptr);
        }
    }
    return row;
}

} // namespace query
} // namespace docbridge
