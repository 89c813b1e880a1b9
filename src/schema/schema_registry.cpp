#include "schema/schema_registry.h"
#include "schema/namespacer.h"
#include "utils/errors.h"
#include "utils/logger.h"

#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace docbridge {

namespace {

EngineConfig parseEngine(const YAML::Node& root) {
    EngineConfig cfg;
    if (auto engine = root["engine"]) {
        cfg.default_scan_limit = engine["default_scan_limit"].as<size_t>(100);
        cfg.delete_batch_size = engine["delete_batch_size"].as<size_t>(100);
        cfg.log_level = engine["log_level"].as<std::string>("info");
        cfg.log_file = engine["log_file"].as<std::string>("");
    }
    if (auto store = root["store"]) {
        cfg.store.db_path = store["path"].as<std::string>(cfg.store.db_path);
        cfg.store.memtable_size_mb = store["memtable_size_mb"].as<size_t>(cfg.store.memtable_size_mb);
        cfg.store.block_cache_size_mb = store["block_cache_size_mb"].as<size_t>(cfg.store.block_cache_size_mb);
        cfg.store.bloom_bits_per_key = store["bloom_bits_per_key"].as<int>(cfg.store.bloom_bits_per_key);
        cfg.store.enable_wal = store["enable_wal"].as<bool>(cfg.store.enable_wal);
        cfg.store.lock_timeout_ms = store["lock_timeout_ms"].as<int64_t>(cfg.store.lock_timeout_ms);
        cfg.store.default_find_limit = store["default_find_limit"].as<size_t>(cfg.store.default_find_limit);
        cfg.store.compression = store["compression"].as<std::string>(cfg.store.compression);
    }
    if (cfg.default_scan_limit == 0) throw ConfigurationError("engine.default_scan_limit must be positive");
    if (cfg.delete_batch_size == 0) throw ConfigurationError("engine.delete_batch_size must be positive");
    return cfg;
}

SchemaDefinition parseSchema(const YAML::Node& node) {
    SchemaDefinition schema;
    schema.type_name = node["type"].as<std::string>("");
    if (schema.type_name.empty()) throw ConfigurationError("schema entry without 'type'");

    schema.ns = node["namespace"].as<std::string>("");
    schema.primary_key = node["primary_key"].as<std::string>("_id");

    if (auto fields = node["fields"]) {
        if (!fields.IsMap()) throw ConfigurationError(schema.type_name, "'fields' must be a map of name: type");
        for (const auto& kv : fields) {
            FieldSpec spec;
            spec.name = kv.first.as<std::string>();
            std::string type_name = kv.second.as<std::string>("string");
            auto type = fieldTypeFromString(type_name);
            if (!type) throw ConfigurationError(schema.type_name, "unknown type '" + type_name + "' for field " + spec.name);
            spec.type = *type;
            schema.fields.push_back(std::move(spec));
        }
    }

    if (auto unique = node["unique"]) {
        for (const auto& u : unique) {
            UniqueConstraint uc;
            if (u.IsScalar()) {
                // Kurzform: nur der Name ("email-username-index")
                uc.name = u.as<std::string>();
                schema.constraints.unique.push_back(std::move(uc));
                continue;
            }
            uc.name = u["name"].as<std::string>("");
            if (auto f = u["fields"]) {
                for (const auto& name : f) uc.fields.push_back(name.as<std::string>());
            }
            schema.constraints.unique.push_back(std::move(uc));
        }
    }

    if (auto fks = node["foreign_keys"]) {
        for (const auto& f : fks) {
            ForeignKeyConstraint fk;
            fk.field = f["field"].as<std::string>("");
            fk.name = f["name"].as<std::string>(fk.field);
            fk.target = f["target"].as<std::string>("");
            schema.constraints.foreign_keys.push_back(std::move(fk));
        }
    }
    return schema;
}

SchemaRegistry fromNode(const YAML::Node& root) {
    SchemaRegistry registry;
    registry.setConfig(parseEngine(root));
    if (auto schemas = root["schemas"]) {
        if (!schemas.IsSequence()) throw ConfigurationError("'schemas' must be a list");
        for (const auto& node : schemas) registry.add(parseSchema(node));
    }
    return registry;
}

} // namespace

SchemaRegistry SchemaRegistry::loadFromYaml(const std::string& yaml_path) {
    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        SchemaRegistry registry = fromNode(root);
        DOCBRIDGE_INFO("Loaded {} schemas from {}", registry.size(), yaml_path);
        return registry;
    } catch (const YAML::Exception& e) {
        DOCBRIDGE_ERROR("Failed to load schema configuration from {}: {}", yaml_path, e.what());
        throw ConfigurationError(yaml_path + ": " + e.what());
    }
}

SchemaRegistry SchemaRegistry::loadFromYamlString(const std::string& yaml) {
    try {
        return fromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("invalid schema configuration: ") + e.what());
    }
}

void SchemaRegistry::add(SchemaDefinition schema) {
    if (schema.type_name.empty()) throw ConfigurationError("schema without type name");
    if (schema.ns.empty()) schema.ns = Namespacer::namespaceOf(schema.type_name);
    if (schema.primary_key.empty()) schema.primary_key = "_id";
    if (schemas_.count(schema.type_name)) {
        throw ConfigurationError(schema.type_name, "schema registered twice");
    }

    auto declared = schema.fieldNames();
    for (auto& uc : schema.constraints.unique) {
        if (uc.fields.empty()) uc.fields = uniqueFieldsFromName(uc.name);
        if (uc.fields.empty()) {
            throw ConfigurationError(schema.type_name,
                "unique constraint '" + uc.name + "' requires field names separated by \"-\"");
        }
        if (uc.name.empty()) {
            for (const auto& f : uc.fields) uc.name += f + "-";
            uc.name += "index";
        }
        if (declared.empty()) continue;
        for (const auto& f : uc.fields) {
            if (!schema.isPrimaryKey(f) && std::find(declared.begin(), declared.end(), f) == declared.end()) {
                throw ConfigurationError(schema.type_name,
                    "unique constraint '" + uc.name + "' references undeclared field " + f);
            }
        }
    }
    for (const auto& fk : schema.constraints.foreign_keys) {
        if (fk.field.empty()) throw ConfigurationError(schema.type_name, "foreign key without field");
    }

    DOCBRIDGE_DEBUG("SchemaRegistry: {} -> namespace {}", schema.type_name, schema.ns);
    std::string key = schema.type_name;
    schemas_.emplace(std::move(key), std::move(schema));
}

const SchemaDefinition* SchemaRegistry::find(const std::string& name) const {
    auto it = schemas_.find(name);
    if (it != schemas_.end()) return &it->second;
    for (const auto& [type, schema] : schemas_) {
        if (schema.ns == name) return &schema;
    }
    return nullptr;
}

const SchemaDefinition& SchemaRegistry::get(const std::string& name) const {
    const SchemaDefinition* schema = find(name);
    if (!schema) throw ConfigurationError(name, "unknown schema");
    return *schema;
}

void initLogging(const EngineConfig& config) {
    utils::Logger::init(config.log_file, utils::Logger::levelFromString(config.log_level));
}

std::vector<std::string> SchemaRegistry::typeNames() const {
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& [type, schema] : schemas_) names.push_back(type);
    return names;
}

} // namespace docbridge
