#include "schema/schema.h"

namespace docbridge {

nlohmann::json zeroValue(FieldType type) {
    switch (type) {
        case FieldType::String: return "";
        case FieldType::Integer: return 0;
        case FieldType::Float: return 0.0;
        case FieldType::Boolean: return false;
        case FieldType::List: return nlohmann::json::array();
        case FieldType::Map: return nlohmann::json::object();
        case FieldType::BinaryId: return "";
    }
    return nullptr;
}

std::optional<FieldType> fieldTypeFromString(const std::string& name) {
    if (name == "string") return FieldType::String;
    if (name == "integer" || name == "int") return FieldType::Integer;
    if (name == "float" || name == "double") return FieldType::Float;
    if (name == "boolean" || name == "bool") return FieldType::Boolean;
    if (name == "list" || name == "array") return FieldType::List;
    if (name == "map" || name == "object") return FieldType::Map;
    if (name == "binary_id") return FieldType::BinaryId;
    return std::nullopt;
}

const char* fieldTypeToString(FieldType type) {
    switch (type) {
        case FieldType::String: return "string";
        case FieldType::Integer: return "integer";
        case FieldType::Float: return "float";
        case FieldType::Boolean: return "boolean";
        case FieldType::List: return "list";
        case FieldType::Map: return "map";
        case FieldType::BinaryId: return "binary_id";
    }
    return "string";
}

std::vector<std::string> uniqueFieldsFromName(const std::string& constraint_name) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (start <= constraint_name.size()) {
        size_t end = constraint_name.find('-', start);
        if (end == std::string::npos) end = constraint_name.size();
        std::string part = constraint_name.substr(start, end - start);
        if (!part.empty() && part != "index") fields.push_back(std::move(part));
        start = end + 1;
    }
    return fields;
}

std::vector<std::string> SchemaDefinition::fieldNames() const {
    std::vector<std::string> names;
    names.reserve(fields.size());
    for (const auto& f : fields) names.push_back(f.name);
    return names;
}

FieldMeta SchemaDefinition::fieldMeta() const {
    FieldMeta meta;
    for (const auto& f : fields) meta.emplace(f.name, f.type);
    return meta;
}

bool SchemaDefinition::isPrimaryKey(const std::string& field) const {
    return field == "_id" || field == primary_key;
}

} // namespace docbridge
