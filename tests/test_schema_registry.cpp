#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>

#include "schema/schema_registry.h"
#include "utils/errors.h"
#include "utils/logger.h"

using namespace docbridge;

namespace {

const char* kConfig = R"(
engine:
  default_scan_limit: 50
  delete_batch_size: 20
  log_level: debug
store:
  path: /tmp/docbridge_cfg
  lock_timeout_ms: 250
  default_find_limit: 10
  compression: lz4
schemas:
  - type: Accounts.UserProfile
    primary_key: login
    fields:
      login: string
      email: string
      username: string
      age: integer
      tags: list
    unique:
      - email-username-index
      - { name: by_login, fields: [login] }
    foreign_keys:
      - { field: org_id, target: organization }
  - type: Organization
    namespace: org
    fields:
      name: string
)";

} // namespace

// ============================================================================
// Loading
// ============================================================================

TEST(SchemaRegistryTest, LoadsSchemasFromYamlString) {
    auto registry = SchemaRegistry::loadFromYamlString(kConfig);
    ASSERT_EQ(registry.size(), 2u);

    const auto& user = registry.get("Accounts.UserProfile");
    EXPECT_EQ(user.ns, "user_profile");
    EXPECT_EQ(user.primary_key, "login");
    EXPECT_EQ(user.fieldNames(), (std::vector<std::string>{"login", "email", "username", "age", "tags"}));
    EXPECT_EQ(user.fieldMeta().at("age"), FieldType::Integer);
    EXPECT_EQ(user.fieldMeta().at("tags"), FieldType::List);

    ASSERT_EQ(user.constraints.unique.size(), 2u);
    EXPECT_EQ(user.constraints.unique[0].name, "email-username-index");
    EXPECT_EQ(user.constraints.unique[0].fields, (std::vector<std::string>{"email", "username"}));
    EXPECT_EQ(user.constraints.unique[1].name, "by_login");
    EXPECT_EQ(user.constraints.unique[1].fields, (std::vector<std::string>{"login"}));

    ASSERT_EQ(user.constraints.foreign_keys.size(), 1u);
    EXPECT_EQ(user.constraints.foreign_keys[0].name, "org_id");
    EXPECT_EQ(user.constraints.foreign_keys[0].target, "organization");

    EXPECT_EQ(registry.get("Organization").ns, "org");
}

TEST(SchemaRegistryTest, LookupByNamespace) {
    auto registry = SchemaRegistry::loadFromYamlString(kConfig);
    const SchemaDefinition* s = registry.find("user_profile");
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->type_name, "Accounts.UserProfile");
    EXPECT_EQ(registry.find("nothing"), nullptr);
    EXPECT_THROW(registry.get("nothing"), ConfigurationError);
}

TEST(SchemaRegistryTest, EngineAndStoreSections) {
    auto registry = SchemaRegistry::loadFromYamlString(kConfig);
    const auto& cfg = registry.config();
    EXPECT_EQ(cfg.default_scan_limit, 50u);
    EXPECT_EQ(cfg.delete_batch_size, 20u);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.store.db_path, "/tmp/docbridge_cfg");
    EXPECT_EQ(cfg.store.lock_timeout_ms, 250);
    EXPECT_EQ(cfg.store.default_find_limit, 10u);
    EXPECT_EQ(cfg.store.compression, "lz4");
    // nicht gesetzt: Defaults
    EXPECT_EQ(cfg.store.memtable_size_mb, 64u);
    EXPECT_TRUE(cfg.store.enable_wal);
}

TEST(SchemaRegistryTest, DefaultsWithoutEngineSection) {
    auto registry = SchemaRegistry::loadFromYamlString("schemas: []\n");
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.config().default_scan_limit, 100u);
    EXPECT_EQ(registry.config().delete_batch_size, 100u);
}

TEST(SchemaRegistryTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() /
        ("docbridge_schema_" + std::to_string(std::chrono::high_resolution_clock::now().time_since_epoch().count()) + ".yaml");
    {
        std::ofstream out(path);
        out << kConfig;
    }
    auto registry = SchemaRegistry::loadFromYaml(path.string());
    EXPECT_EQ(registry.size(), 2u);
    std::filesystem::remove(path);

    EXPECT_THROW(SchemaRegistry::loadFromYaml(path.string()), ConfigurationError);
}

// ============================================================================
// Invalid definitions
// ============================================================================

TEST(SchemaRegistryTest, UnknownFieldTypeIsRejected) {
    EXPECT_THROW(SchemaRegistry::loadFromYamlString(R"(
schemas:
  - type: User
    fields: { email: text }
)"), ConfigurationError);
}

TEST(SchemaRegistryTest, UniqueNameWithoutFieldsIsRejected) {
    EXPECT_THROW(SchemaRegistry::loadFromYamlString(R"(
schemas:
  - type: User
    fields: { email: string }
    unique: [ index ]
)"), ConfigurationError);
}

TEST(SchemaRegistryTest, UniqueOnUndeclaredFieldIsRejected) {
    EXPECT_THROW(SchemaRegistry::loadFromYamlString(R"(
schemas:
  - type: User
    fields: { email: string }
    unique: [ phone-index ]
)"), ConfigurationError);
}

TEST(SchemaRegistryTest, UniqueOnPrimaryKeyAliasIsAllowed) {
    auto registry = SchemaRegistry::loadFromYamlString(R"(
schemas:
  - type: User
    primary_key: login
    fields: { email: string }
    unique: [ login-index ]
)");
    EXPECT_EQ(registry.get("User").constraints.unique[0].fields, (std::vector<std::string>{"login"}));
}

TEST(SchemaRegistryTest, MissingTypeAndZeroLimitsAreRejected) {
    EXPECT_THROW(SchemaRegistry::loadFromYamlString("schemas:\n  - fields: { a: string }\n"), ConfigurationError);
    EXPECT_THROW(SchemaRegistry::loadFromYamlString("engine:\n  default_scan_limit: 0\n"), ConfigurationError);
    EXPECT_THROW(SchemaRegistry::loadFromYamlString("schemas: [ { type: [unclosed\n"), ConfigurationError);
}

TEST(SchemaRegistryTest, DuplicateTypeIsRejected) {
    SchemaRegistry registry;
    SchemaDefinition s;
    s.type_name = "Person";
    registry.add(s);
    EXPECT_EQ(registry.get("Person").ns, "person");
    EXPECT_THROW(registry.add(s), ConfigurationError);
}

TEST(SchemaRegistryTest, GeneratedNameForFieldListConstraint) {
    SchemaRegistry registry;
    SchemaDefinition s;
    s.type_name = "People";
    s.fields = {{"email", FieldType::String}, {"city", FieldType::String}};
    s.constraints.unique.push_back(UniqueConstraint{"", {"email", "city"}});
    registry.add(s);

    const auto& stored = registry.get("person");
    EXPECT_EQ(stored.ns, "person");
    EXPECT_EQ(stored.constraints.unique[0].name, "email-city-index");
}

TEST(SchemaRegistryTest, InitLoggingFromEngineConfig) {
    auto registry = SchemaRegistry::loadFromYamlString(kConfig);
    initLogging(registry.config());
    EXPECT_TRUE(utils::Logger::isInitialized());
    utils::Logger::shutdown();
    EXPECT_FALSE(utils::Logger::isInitialized());
}
