#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "schema/schema.h"
#include "storage/document_store.h"

namespace docbridge {

enum class ConstraintKind { Unique, ForeignKey };

const char* constraintKindName(ConstraintKind kind);

/// Verdict of one declared constraint for one write
struct ConstraintResult {
    enum class State { Ok, OkPending, Invalid, Error };

    State state = State::Ok;
    ConstraintKind kind = ConstraintKind::Unique;
    std::string constraint;   // Constraint-Name
    std::string id;           // marker id (unique) bzw. referenzierte id (foreign key)
    std::string reason;       // nur bei Error

    bool isOk() const { return state == State::Ok || state == State::OkPending; }

    static ConstraintResult Ok(ConstraintKind kind, std::string name) {
        return {State::Ok, kind, std::move(name), "", ""};
    }
    static ConstraintResult Pending(std::string name, std::string marker_id) {
        return {State::OkPending, ConstraintKind::Unique, std::move(name), std::move(marker_id), ""};
    }
    static ConstraintResult Invalid(ConstraintKind kind, std::string name, std::string id) {
        return {State::Invalid, kind, std::move(name), std::move(id), ""};
    }
    static ConstraintResult Error(ConstraintKind kind, std::string name, std::string reason) {
        return {State::Error, kind, std::move(name), "", std::move(reason)};
    }
};

struct ConstraintViolation {
    ConstraintKind kind = ConstraintKind::Unique;
    std::string constraint;
    std::string id;

    bool operator==(const ConstraintViolation& o) const {
        return kind == o.kind && constraint == o.constraint && id == o.id;
    }
};

struct PendingMarker {
    std::string constraint;
    std::string marker_id;
};

/// Merged outcome of all constraints of one write
struct ConstraintVerdict {
    std::vector<ConstraintViolation> violations;
    std::vector<std::string> errors;
    std::vector<PendingMarker> pending;

    bool ok() const { return violations.empty() && errors.empty(); }
};

/**
 * Uniqueness and foreign-key emulation on top of a DocumentStore.
 *
 * A unique constraint over fields (f1, f2) is backed by a marker document
 *   {"_id": "<namespace>-<v1>-<v2>", "type": "constraint"}
 * whose existence means "taken". validate() only reads; reserve() writes
 * the markers after a clean verdict, before the document write.
 */
class ConstraintEngine {
public:
    static constexpr const char* MARKER_TYPE = "constraint";

    /// One result per declared constraint (unique first, then foreign keys).
    /// prev_fields: stored state on update; the effective state is prev merged with new.
    /// Throws ConfigurationError for incomplete unique keys.
    static std::vector<ConstraintResult> validate(DocumentStore& store,
                                                  const SchemaDefinition& schema,
                                                  const nlohmann::json& new_fields,
                                                  const nlohmann::json* prev_fields = nullptr);

    /// "<source>-<values joined by '-'>"; throws ConfigurationError if the key is incomplete
    static std::string markerId(const SchemaDefinition& schema,
                                const UniqueConstraint& constraint,
                                const nlohmann::json& fields);

    /// Explicit field list or the one derived from the constraint name
    static std::vector<std::string> uniqueFields(const UniqueConstraint& constraint);

    static ConstraintVerdict merge(const std::vector<ConstraintResult>& results);

    /// Persist the pending markers of a clean verdict. A marker that already exists
    /// (lost race) turns into a unique violation; markers reserved so far are released.
    static ConstraintVerdict reserve(DocumentStore& store, const ConstraintVerdict& verdict);

    /// Best-effort removal of marker documents
    static void release(DocumentStore& store, const std::vector<std::string>& marker_ids);

    /// Marker ids of a stored document (fields missing -> no marker for that constraint)
    static std::vector<std::string> markersOf(const SchemaDefinition& schema, const nlohmann::json& doc);

private:
    static std::optional<std::string> tryMarkerId_(const SchemaDefinition& schema,
                                                   const UniqueConstraint& constraint,
                                                   const nlohmann::json& fields);

    static ConstraintResult checkUnique_(DocumentStore& store,
                                         const SchemaDefinition& schema,
                                         const UniqueConstraint& constraint,
                                         const nlohmann::json& effective,
                                         const nlohmann::json* prev_fields);

    static ConstraintResult checkForeignKey_(DocumentStore& store,
                                             const ForeignKeyConstraint& constraint,
                                             const nlohmann::json& effective);
};

} // namespace docbridge
