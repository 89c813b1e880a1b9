#pragma once

#include <map>
#include <string>
#include <vector>

#include "schema/schema.h"
#include "storage/rocksdb_document_store.h"

namespace docbridge {

/// Engine-wide settings from the "engine" and "store" YAML sections
struct EngineConfig {
    size_t default_scan_limit = 100;   // RangeScan ohne limit
    size_t delete_batch_size = 100;    // removeAll Seitengröße
    std::string log_level = "info";
    std::string log_file;              // leer = nur Konsole
    RocksDBDocumentStore::Config store;
};

/**
 * @brief Schema definitions and engine configuration, loaded once
 *
 * YAML layout:
 *   engine:  { default_scan_limit, delete_batch_size, log_level, log_file }
 *   store:   { path, memtable_size_mb, block_cache_size_mb, bloom_bits_per_key,
 *              enable_wal, lock_timeout_ms, default_find_limit, compression }
 *   schemas:
 *     - type: Accounts.User
 *       namespace: user            # optional, derived from type
 *       primary_key: login         # optional alias of _id
 *       fields: { email: string, age: integer }
 *       unique: [ { name: email-index }, { name: by_login, fields: [login] } ]
 *       foreign_keys: [ { name: org_fk, field: org_id, target: organization } ]
 *
 * Read-only after loading. Invalid input raises ConfigurationError.
 */
class SchemaRegistry {
public:
    static SchemaRegistry loadFromYaml(const std::string& yaml_path);
    static SchemaRegistry loadFromYamlString(const std::string& yaml);

    /// Validate, fill derived parts (namespace, unique fields) and register
    void add(SchemaDefinition schema);

    /// Lookup by type name or namespace; throws ConfigurationError if unknown
    const SchemaDefinition& get(const std::string& name) const;
    const SchemaDefinition* find(const std::string& name) const;

    const EngineConfig& config() const { return config_; }
    void setConfig(EngineConfig config) { config_ = std::move(config); }

    std::vector<std::string> typeNames() const;
    size_t size() const { return schemas_.size(); }

private:
    EngineConfig config_;
    std::map<std::string, SchemaDefinition> schemas_; // type name -> schema
};

/// Initialize the logger from the engine section (level, optional file sink)
void initLogging(const EngineConfig& config);

} // namespace docbridge
