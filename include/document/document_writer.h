#pragma once

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "constraint/constraint_engine.h"
#include "schema/schema.h"
#include "storage/document_store.h"

namespace docbridge {
namespace document {

using json = nlohmann::json;

/// Outcome of one document write
struct WriteOutcome {
    enum class Status { Ok, Invalid, Error };

    Status status = Status::Ok;
    std::vector<std::pair<std::string, json>> values;   // requested returning fields
    std::vector<ConstraintViolation> violations;        // bei Invalid
    std::string error;                                  // bei Error, "<error> :: <reason>"
    std::string id;                                     // qualifizierte Dokument-Id
    std::string rev;

    bool ok() const { return status == Status::Ok; }

    static WriteOutcome Invalid(std::vector<ConstraintViolation> v) {
        WriteOutcome o;
        o.status = Status::Invalid;
        o.violations = std::move(v);
        return o;
    }

    static WriteOutcome Error(std::string msg) {
        WriteOutcome o;
        o.status = Status::Error;
        o.error = std::move(msg);
        return o;
    }
};

/**
 * @brief Write path: constraints, marker reservation, revisioned store write
 *
 * Every write first runs the ConstraintEngine; only a clean verdict reaches
 * the store. Markers of a failed store write are released again.
 * ConfigurationError from an incomplete unique key propagates.
 */
class DocumentWriter {
public:
    static constexpr size_t DEFAULT_DELETE_BATCH = 100;

    /// Insert; _id (or the schema's primary-key alias) is qualified, a UUID is
    /// generated when absent, "type" is set to the namespace
    static WriteOutcome insert(DocumentStore& store,
                               const SchemaDefinition& schema,
                               const json& fields,
                               const std::vector<std::string>& returning);

    /// Merge changes over the stored document and write with its revision
    static WriteOutcome update(DocumentStore& store,
                               const SchemaDefinition& schema,
                               const std::string& id,
                               const json& changes,
                               const std::vector<std::string>& returning);

    /// One outcome per item in input order; failing items never block siblings.
    /// All items are validated before the first marker is reserved.
    static std::vector<WriteOutcome> bulkInsert(DocumentStore& store,
                                                const SchemaDefinition& schema,
                                                const std::vector<json>& items,
                                                const std::vector<std::string>& returning);

    /// Fetch revision, delete, release unique markers
    static WriteOutcome remove(DocumentStore& store,
                               const SchemaDefinition& schema,
                               const std::string& id);

    /// Delete every document of the namespace in batches; returns the deleted count
    static std::pair<StoreStatus, size_t> removeAll(DocumentStore& store,
                                                    const SchemaDefinition& schema,
                                                    size_t batch_size = DEFAULT_DELETE_BATCH);

    /// Values of the requested fields; primary-key alias maps to _id, absent -> null
    static std::vector<std::pair<std::string, json>> mapReturning(const SchemaDefinition& schema,
                                                                  const json& doc,
                                                                  const std::vector<std::string>& returning);

private:
    /// Body for a new document: qualified _id, type, pk alias folded into _id
    static json prepareInsert_(const SchemaDefinition& schema, const json& fields);

    /// Constraint check plus reservation; Ok outcome carries no values
    static WriteOutcome checkAndReserve_(DocumentStore& store,
                                         const SchemaDefinition& schema,
                                         const json& fields,
                                         const json* prev,
                                         std::vector<std::string>& reserved);

    /// Reservation of an already merged verdict
    static WriteOutcome reserveVerdict_(DocumentStore& store,
                                        ConstraintVerdict verdict,
                                        std::vector<std::string>& reserved);
};

} // namespace document
} // namespace docbridge
