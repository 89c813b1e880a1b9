#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <filesystem>

#include "document/document_writer.h"
#include "mock_document_store.h"
#include "schema/namespacer.h"
#include "storage/rocksdb_document_store.h"
#include "utils/errors.h"

using namespace docbridge;
using namespace docbridge::document;
using nlohmann::json;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

using GetReply = std::pair<StoreStatus, json>;

SchemaDefinition userSchema() {
    SchemaDefinition s;
    s.type_name = "User";
    s.ns = "user";
    s.primary_key = "id";
    s.fields = {{"email", FieldType::String}, {"name", FieldType::String}, {"account_id", FieldType::String}};
    s.constraints.unique.push_back(UniqueConstraint{"email-index", {}});
    s.constraints.foreign_keys.push_back(ForeignKeyConstraint{"account", "account_id", "account"});
    return s;
}

// Primärschlüssel "login" mit eigenem Unique-Index
SchemaDefinition loginSchema() {
    SchemaDefinition s;
    s.type_name = "User";
    s.ns = "user";
    s.primary_key = "login";
    s.fields = {{"login", FieldType::String}, {"email", FieldType::String}};
    s.constraints.unique.push_back(UniqueConstraint{"login-index", {}});
    return s;
}

} // namespace

class DocumentWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        RocksDBDocumentStore::Config cfg;
        cfg.db_path = (std::filesystem::temp_directory_path() /
            ("docbridge_writer_" + std::to_string(std::chrono::high_resolution_clock::now().time_since_epoch().count()))).string();
        cfg.enable_wal = false;
        path_ = cfg.db_path;
        store_ = std::make_unique<RocksDBDocumentStore>(cfg);
        ASSERT_TRUE(store_->open());
        schema_ = userSchema();
    }

    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(path_);
    }

    bool exists(const std::string& id) {
        return store_->get(Namespacer::encodeForTransport(id)).first.ok();
    }

    json stored(const std::string& id) {
        return store_->get(Namespacer::encodeForTransport(id)).second;
    }

    std::string path_;
    std::unique_ptr<RocksDBDocumentStore> store_;
    SchemaDefinition schema_;
};

// ============================================================================
// insert
// ============================================================================

TEST_F(DocumentWriterTest, InsertReturnsRequestedFields) {
    auto out = DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "a@b.com"}, {"name", "Al"}},
                                      {"id", "email", "missing"});
    ASSERT_TRUE(out.ok()) << out.error;
    EXPECT_EQ(out.id, "user/1");
    EXPECT_EQ(out.rev.substr(0, 2), "1-");
    ASSERT_EQ(out.values.size(), 3u);
    EXPECT_EQ(out.values[0], (std::pair<std::string, json>{"id", "user/1"}));
    EXPECT_EQ(out.values[1], (std::pair<std::string, json>{"email", "a@b.com"}));
    EXPECT_EQ(out.values[2], (std::pair<std::string, json>{"missing", nullptr}));

    json doc = stored("user/1");
    EXPECT_EQ(doc["type"], "user");
    EXPECT_FALSE(doc.contains("id"));
    EXPECT_TRUE(exists("user-a@b.com"));
}

TEST_F(DocumentWriterTest, InsertWithoutIdGeneratesUuid) {
    auto out = DocumentWriter::insert(*store_, schema_, {{"email", "a@b.com"}}, {"id"});
    ASSERT_TRUE(out.ok()) << out.error;
    ASSERT_TRUE(Namespacer::isQualified("user", out.id));
    EXPECT_EQ(Namespacer::unqualify("user", out.id).size(), 36u);
    EXPECT_EQ(out.values[0].second, out.id);
}

TEST_F(DocumentWriterTest, DuplicateUniqueValueIsRejected) {
    ASSERT_TRUE(DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "a@b.com"}}, {}).ok());

    auto out = DocumentWriter::insert(*store_, schema_, {{"id", "2"}, {"email", "a@b.com"}}, {});
    EXPECT_EQ(out.status, WriteOutcome::Status::Invalid);
    ASSERT_EQ(out.violations.size(), 1u);
    EXPECT_EQ(out.violations[0], (ConstraintViolation{ConstraintKind::Unique, "email-index", "user-a@b.com"}));
    EXPECT_FALSE(exists("user/2"));
}

TEST_F(DocumentWriterTest, MissingUniqueFieldIsConfigurationError) {
    EXPECT_THROW(DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"name", "Al"}}, {}), ConfigurationError);
    EXPECT_EQ(store_->countDocuments(), 0u);
}

TEST_F(DocumentWriterTest, ForeignKeyMustReferenceExistingDocument) {
    auto out = DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "a@b.com"}, {"account_id", "9"}}, {});
    EXPECT_EQ(out.status, WriteOutcome::Status::Invalid);
    ASSERT_EQ(out.violations.size(), 1u);
    EXPECT_EQ(out.violations[0], (ConstraintViolation{ConstraintKind::ForeignKey, "account", "account/9"}));
    // Keine Reservierung bei Verletzung
    EXPECT_FALSE(exists("user-a@b.com"));
    EXPECT_EQ(store_->countDocuments(), 0u);

    ASSERT_TRUE(store_->put("account%2F9", {{"type", "account"}}, std::nullopt).first.ok());
    auto ok = DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "a@b.com"}, {"account_id", "9"}}, {});
    EXPECT_TRUE(ok.ok()) << ok.error;
}

TEST_F(DocumentWriterTest, DuplicateIdReleasesReservedMarker) {
    ASSERT_TRUE(DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "a@b.com"}}, {}).ok());

    auto out = DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "other@b.com"}}, {});
    EXPECT_EQ(out.status, WriteOutcome::Status::Error);
    EXPECT_EQ(out.error, "conflict :: Document update conflict.");
    EXPECT_FALSE(exists("user-other@b.com"));
    EXPECT_TRUE(exists("user-a@b.com"));
}

TEST_F(DocumentWriterTest, UniqueOnPrimaryKeyAlias) {
    auto schema = loginSchema();
    auto out = DocumentWriter::insert(*store_, schema, {{"login", "bob"}, {"email", "b@x"}}, {"login"});
    ASSERT_TRUE(out.ok()) << out.error;
    EXPECT_EQ(out.id, "user/bob");
    EXPECT_TRUE(exists("user-bob"));

    auto dup = DocumentWriter::insert(*store_, schema, {{"login", "bob"}, {"email", "other@x"}}, {});
    EXPECT_EQ(dup.status, WriteOutcome::Status::Invalid);
    ASSERT_EQ(dup.violations.size(), 1u);
    EXPECT_EQ(dup.violations[0], (ConstraintViolation{ConstraintKind::Unique, "login-index", "user-bob"}));

    auto upd = DocumentWriter::update(*store_, schema, "bob", {{"email", "c@x"}}, {});
    ASSERT_TRUE(upd.ok()) << upd.error;
    EXPECT_EQ(stored("user/bob")["email"], "c@x");
    EXPECT_TRUE(exists("user-bob"));

    ASSERT_TRUE(DocumentWriter::remove(*store_, schema, "bob").ok());
    EXPECT_FALSE(exists("user-bob"));
}

TEST(DocumentWriterMockTest, ReferenceLookupTimeoutFailsInsertWithoutWrites) {
    StrictMock<MockDocumentStore> store;
    EXPECT_CALL(store, get(std::string_view("user-a%40b.com")))
        .WillOnce(Return(GetReply{StoreStatus::NotFound(), json()}));
    EXPECT_CALL(store, get(std::string_view("account%2F7")))
        .WillOnce(Return(GetReply{StoreStatus::Timeout("get account/7: timed out"), json()}));

    // StrictMock: jedes put (Marker oder Dokument) würde den Test scheitern lassen
    auto out = DocumentWriter::insert(store, userSchema(), {{"id", "1"}, {"email", "a@b.com"}, {"account_id", "7"}}, {});
    EXPECT_EQ(out.status, WriteOutcome::Status::Error);
    EXPECT_EQ(out.error, "timeout :: get account/7: timed out");
    EXPECT_TRUE(out.violations.empty());
}

// ============================================================================
// update
// ============================================================================

TEST_F(DocumentWriterTest, UpdateMergesAndMovesMarker) {
    ASSERT_TRUE(DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "a@b.com"}, {"name", "Al"}}, {}).ok());

    auto out = DocumentWriter::update(*store_, schema_, "1", {{"email", "new@b.com"}, {"id", "ignored"}},
                                      {"id", "email", "name"});
    ASSERT_TRUE(out.ok()) << out.error;
    EXPECT_EQ(out.rev.substr(0, 2), "2-");
    EXPECT_EQ(out.values[0].second, "user/1");
    EXPECT_EQ(out.values[1].second, "new@b.com");
    EXPECT_EQ(out.values[2].second, "Al");

    EXPECT_FALSE(exists("user-a@b.com"));
    EXPECT_TRUE(exists("user-new@b.com"));

    // Alter Wert ist wieder frei
    EXPECT_TRUE(DocumentWriter::insert(*store_, schema_, {{"id", "2"}, {"email", "a@b.com"}}, {}).ok());
}

TEST_F(DocumentWriterTest, UpdateKeepingKeyDoesNotConflictWithOwnMarker) {
    ASSERT_TRUE(DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "a@b.com"}}, {}).ok());
    auto out = DocumentWriter::update(*store_, schema_, "user/1", {{"name", "Al"}}, {"name"});
    ASSERT_TRUE(out.ok()) << out.error;
    EXPECT_TRUE(exists("user-a@b.com"));
    EXPECT_EQ(stored("user/1")["name"], "Al");
}

TEST_F(DocumentWriterTest, UpdateToTakenValueIsRejected) {
    ASSERT_TRUE(DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "a@b.com"}}, {}).ok());
    ASSERT_TRUE(DocumentWriter::insert(*store_, schema_, {{"id", "2"}, {"email", "b@b.com"}}, {}).ok());

    auto out = DocumentWriter::update(*store_, schema_, "2", {{"email", "a@b.com"}}, {});
    EXPECT_EQ(out.status, WriteOutcome::Status::Invalid);
    EXPECT_EQ(stored("user/2")["email"], "b@b.com");
}

TEST_F(DocumentWriterTest, UpdateOfMissingDocumentIsError) {
    auto out = DocumentWriter::update(*store_, schema_, "404", {{"name", "x"}}, {});
    EXPECT_EQ(out.status, WriteOutcome::Status::Error);
    EXPECT_EQ(out.error, "not_found :: missing");
}

// ============================================================================
// bulkInsert
// ============================================================================

TEST_F(DocumentWriterTest, BulkInsertReportsCollidingIdOnly) {
    ASSERT_TRUE(DocumentWriter::insert(*store_, schema_, {{"id", "3"}, {"email", "taken@b.com"}}, {}).ok());

    std::vector<json> items;
    for (int i = 1; i <= 5; ++i) {
        items.push_back({{"id", std::to_string(i)}, {"email", "b" + std::to_string(i) + "@b.com"}});
    }
    auto outcomes = DocumentWriter::bulkInsert(*store_, schema_, items, {"id"});
    ASSERT_EQ(outcomes.size(), 5u);

    int failed = 0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        EXPECT_EQ(outcomes[i].id, "user/" + std::to_string(i + 1));
        if (outcomes[i].ok()) {
            EXPECT_FALSE(outcomes[i].rev.empty());
            EXPECT_EQ(outcomes[i].values[0].second, outcomes[i].id);
        } else {
            ++failed;
            EXPECT_EQ(i, 2u);
            EXPECT_EQ(outcomes[i].error, "conflict :: Document update conflict.");
            EXPECT_EQ(outcomes[i].values[0].second, "user/3");
        }
    }
    EXPECT_EQ(failed, 1);
    EXPECT_FALSE(exists("user-b3@b.com"));
    EXPECT_TRUE(exists("user-b5@b.com"));
}

TEST_F(DocumentWriterTest, BulkInsertDuplicateWithinBatch) {
    auto outcomes = DocumentWriter::bulkInsert(*store_, schema_,
        {json{{"id", "a"}, {"email", "same@b.com"}}, json{{"id", "b"}, {"email", "same@b.com"}}}, {});
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].ok()) << outcomes[0].error;
    EXPECT_EQ(outcomes[1].status, WriteOutcome::Status::Invalid);
    EXPECT_EQ(outcomes[1].id, "user/b");
    EXPECT_FALSE(exists("user/b"));
}

TEST_F(DocumentWriterTest, BulkInsertConfigurationErrorLeavesNoMarkers) {
    std::vector<json> items = {json{{"id", "1"}, {"email", "a@x"}}, json{{"id", "2"}}};
    EXPECT_THROW(DocumentWriter::bulkInsert(*store_, schema_, items, {}), ConfigurationError);
    EXPECT_FALSE(exists("user-a@x"));
    EXPECT_EQ(store_->countDocuments(), 0u);

    auto retry = DocumentWriter::insert(*store_, schema_, items[0], {});
    EXPECT_TRUE(retry.ok()) << retry.error;
}

TEST(DocumentWriterMockTest, BulkInsertValidatesAllItemsBeforeReserving) {
    StrictMock<MockDocumentStore> store;
    EXPECT_CALL(store, get(std::string_view("user-a%40x")))
        .WillOnce(Return(GetReply{StoreStatus::NotFound(), json()}));

    // Kein put erwartet: das zweite Item scheitert vor jeder Reservierung
    std::vector<json> items = {json{{"id", "1"}, {"email", "a@x"}}, json{{"id", "2"}}};
    EXPECT_THROW(DocumentWriter::bulkInsert(store, userSchema(), items, {}), ConfigurationError);
}

// ============================================================================
// remove / removeAll
// ============================================================================

TEST_F(DocumentWriterTest, RemoveDeletesDocumentAndMarker) {
    ASSERT_TRUE(DocumentWriter::insert(*store_, schema_, {{"id", "1"}, {"email", "a@b.com"}}, {}).ok());

    auto out = DocumentWriter::remove(*store_, schema_, "1");
    ASSERT_TRUE(out.ok()) << out.error;
    EXPECT_FALSE(exists("user/1"));
    EXPECT_FALSE(exists("user-a@b.com"));

    auto again = DocumentWriter::remove(*store_, schema_, "1");
    EXPECT_EQ(again.error, "not_found :: missing");
}

TEST_F(DocumentWriterTest, RemoveAllDeletesOnlyNamespace) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(DocumentWriter::insert(*store_, schema_,
            {{"id", std::to_string(i)}, {"email", std::to_string(i) + "@b.com"}}, {}).ok());
    }
    ASSERT_TRUE(store_->put("order%2F1", {{"type", "order"}}, std::nullopt).first.ok());
    ASSERT_TRUE(store_->put("users%2F1", {{"type", "users"}}, std::nullopt).first.ok());

    auto [st, deleted] = DocumentWriter::removeAll(*store_, schema_, 2);
    ASSERT_TRUE(st.ok()) << st.message;
    EXPECT_EQ(deleted, 5u);
    // Übrig: fremde Namespaces, Marker sind freigegeben
    EXPECT_EQ(store_->countDocuments(), 2u);
    EXPECT_TRUE(exists("order/1"));
    EXPECT_TRUE(exists("users/1"));

    auto [st2, none] = DocumentWriter::removeAll(*store_, schema_);
    EXPECT_TRUE(st2.ok());
    EXPECT_EQ(none, 0u);
}

TEST(DocumentWriterMappingTest, ReturningMapsPrimaryKeyAlias) {
    auto values = DocumentWriter::mapReturning(userSchema(), {{"_id", "user/1"}, {"email", "a"}}, {"id", "_id", "x"});
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0].second, "user/1");
    EXPECT_EQ(values[1].second, "user/1");
    EXPECT_TRUE(values[2].second.is_null());
}
