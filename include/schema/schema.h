#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace docbridge {

/// Semantic field types used for default-value synthesis in projected rows
enum class FieldType {
    String,
    Integer,
    Float,
    Boolean,
    List,
    Map,
    BinaryId
};

/// Zero value of a semantic type ("", 0, 0.0, false, [], {})
nlohmann::json zeroValue(FieldType type);

std::optional<FieldType> fieldTypeFromString(const std::string& name);
const char* fieldTypeToString(FieldType type);

using FieldMeta = std::map<std::string, FieldType>;        // field -> semantic type
using FieldDefaults = std::map<std::string, nlohmann::json>; // field -> static default

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::String;
};

struct UniqueConstraint {
    std::string name;                 // z.B. "email-username-index"
    std::vector<std::string> fields;  // leer -> aus dem Namen abgeleitet
};

struct ForeignKeyConstraint {
    std::string name;
    std::string field;
    std::string target; // Namespace des referenzierten Dokuments (optional)
};

/// "email-username-index" -> {"email", "username"}
std::vector<std::string> uniqueFieldsFromName(const std::string& constraint_name);

struct ConstraintSet {
    std::vector<UniqueConstraint> unique;
    std::vector<ForeignKeyConstraint> foreign_keys;

    bool empty() const { return unique.empty() && foreign_keys.empty(); }
};

/// Schema of one entity type. Loaded once, shared read-only.
struct SchemaDefinition {
    std::string type_name;          // e.g. "UserProfile"
    std::string ns;                 // collection namespace, e.g. "user_profile"
    std::string primary_key = "_id"; // field name callers use for the document id
    std::vector<FieldSpec> fields;  // declared fields in declaration order
    ConstraintSet constraints;

    /// Constraint source used as marker-id prefix (the namespace)
    const std::string& source() const { return ns; }

    std::vector<std::string> fieldNames() const;
    FieldMeta fieldMeta() const;
    bool isPrimaryKey(const std::string& field) const;
};

} // namespace docbridge
