#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <string>
#include "reconcile/reconciler.hpp"
#include "store/memory_record_store.hpp"
#include "mock_record_store.hpp"
#include "test_utils.hpp"

using namespace k7;
using namespace k7::reconcile;
using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class ReconcilerTest : public ::testing::Test {
protected:
    std::unique_ptr<TempDir> dir;
    std::unique_ptr<oplog::OperationLog> log;
    ReconcilerOptions options;

    void SetUp() override {
        init_logging();
        dir = std::make_unique<TempDir>("reconciler_test");
        log = std::make_unique<oplog::OperationLog>(dir->path() / "last.json");
        // 2024-03-05 06:07:08 UTC
        options.clock = [] { return std::chrono::system_clock::time_point(std::chrono::seconds(1709618828)); };
    }

    bool log_contains(const std::string& text, oplog::Severity severity) const {
        for (const auto& entry : log->entries()) {
            if (entry.severity == severity && entry.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    static store::StoredRecord stored(store::RecordId id, const std::string& key) {
        return store::StoredRecord{id, make_record(key)};
    }
};

TEST_F(ReconcilerTest, CreatesNewRecord) {
    StrictMock<MockRecordStore> store;
    record::Record alice = make_record("alice", "$P$Balice");
    alice.attributes.email = "alice@example.com";

    EXPECT_CALL(store, find_by_key("alice")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, create(Field(&record::Record::key, "alice"))).WillOnce(Return(7));

    Reconciler reconciler(store, *log, options);
    ReconcileResult result = reconciler.apply({alice}, false);

    EXPECT_EQ(result.summary, (Summary{1, 0, 0}));
    ASSERT_EQ(result.decisions.size(), 1u);
    const Decision& decision = result.decisions[0];
    EXPECT_EQ(decision.index, 1u);
    EXPECT_EQ(decision.key, "alice");
    EXPECT_EQ(decision.kind, DecisionKind::Created);
    ASSERT_TRUE(decision.id.has_value());
    EXPECT_EQ(*decision.id, ResolvedId(RealId{7}));
    EXPECT_TRUE(log_contains("Processing record entry #1: alice - Successfully created new record (ID: 7).",
                             oplog::Severity::Success));
}

TEST_F(ReconcilerTest, CreateRequestIsSanitizedWithDefaults) {
    StrictMock<MockRecordStore> store;
    record::Record incoming = make_record(" Bob.Smith ", "$P$Bbob");
    incoming.attributes.email = "bogus";
    incoming.attributes.extra["unknown"] = "kept only in the archive";
    incoming.metadata["nickname"] = "bobby";

    record::Record captured;
    EXPECT_CALL(store, find_by_key("bob.smith")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, create(_)).WillOnce([&](const record::Record& r) { captured = r; return 3; });
    EXPECT_CALL(store, set_metadata(3, "nickname", Json::Value("bobby")));

    Reconciler reconciler(store, *log, options);
    reconciler.apply({incoming}, false);

    EXPECT_EQ(captured.key, "bob.smith");
    EXPECT_EQ(captured.credential_hash, std::optional<std::string>("$P$Bbob"));
    EXPECT_EQ(captured.attributes.email, std::optional<std::string>(""));
    EXPECT_EQ(captured.attributes.nice_key, std::optional<std::string>("bob-smith"));
    EXPECT_EQ(captured.attributes.display_name, std::optional<std::string>("bob.smith"));
    EXPECT_EQ(captured.attributes.registered_at, std::optional<std::string>("2024-03-05 06:07:08"));
    EXPECT_TRUE(captured.metadata.empty());
    EXPECT_TRUE(captured.attributes.extra.empty());
}

TEST_F(ReconcilerTest, UpdatesExistingRecord) {
    StrictMock<MockRecordStore> store;

    EXPECT_CALL(store, find_by_key("carol")).WillOnce(Return(stored(12, "carol")));
    EXPECT_CALL(store, update(12, Field(&record::Record::key, "carol")));

    Reconciler reconciler(store, *log, options);
    ReconcileResult result = reconciler.apply({make_record("Carol")}, false);

    EXPECT_EQ(result.summary, (Summary{0, 1, 0}));
    EXPECT_EQ(result.decisions[0].kind, DecisionKind::Updated);
    EXPECT_EQ(*result.decisions[0].id, ResolvedId(RealId{12}));
    EXPECT_TRUE(log_contains("Successfully updated existing record (ID: 12).", oplog::Severity::Success));
}

TEST_F(ReconcilerTest, MissingCredentialIsSkipped) {
    StrictMock<MockRecordStore> store;

    Reconciler reconciler(store, *log, options);
    ReconcileResult result = reconciler.apply({make_record("bob", "")}, false);

    EXPECT_EQ(result.summary, (Summary{0, 0, 1}));
    EXPECT_EQ(result.decisions[0].kind, DecisionKind::Skipped);
    EXPECT_EQ(result.decisions[0].reason, std::optional<SkipReason>(SkipReason::MissingCredential));
    EXPECT_FALSE(result.decisions[0].id.has_value());
    EXPECT_TRUE(log_contains("Processing record entry #1: bob - Skipped - missing credential hash.",
                             oplog::Severity::Warning));
}

TEST_F(ReconcilerTest, MissingKeyIsSkipped) {
    StrictMock<MockRecordStore> store;
    record::Record no_key;
    no_key.credential_hash = "h";

    Reconciler reconciler(store, *log, options);
    ReconcileResult result = reconciler.apply({no_key, make_record("!!!")}, false);

    EXPECT_EQ(result.summary, (Summary{0, 0, 2}));
    for (const auto& decision : result.decisions) {
        EXPECT_EQ(decision.reason, std::optional<SkipReason>(SkipReason::MissingKey));
        EXPECT_TRUE(decision.key.empty());
    }
    EXPECT_TRUE(log_contains("Processing record entry #2: Skipped - missing key.", oplog::Severity::Warning));
}

TEST_F(ReconcilerTest, StoreErrorSkipsRecordAndContinues) {
    StrictMock<MockRecordStore> store;

    EXPECT_CALL(store, find_by_key("dave")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, create(Field(&record::Record::key, "dave")))
        .WillOnce(Throw(store::StoreError("disk full")));
    EXPECT_CALL(store, find_by_key("erin")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, create(Field(&record::Record::key, "erin"))).WillOnce(Return(2));

    Reconciler reconciler(store, *log, options);
    ReconcileResult result = reconciler.apply({make_record("dave"), make_record("erin")}, false);

    EXPECT_EQ(result.summary, (Summary{1, 0, 1}));
    EXPECT_EQ(result.decisions[0].reason, std::optional<SkipReason>(SkipReason::StoreError));
    EXPECT_EQ(result.decisions[0].detail, "disk full");
    EXPECT_FALSE(result.decisions[0].id.has_value());
    EXPECT_EQ(result.decisions[1].kind, DecisionKind::Created);
    EXPECT_TRUE(log_contains("dave - Error creating new record: disk full", oplog::Severity::Error));
}

TEST_F(ReconcilerTest, DryRunNeverMutates) {
    StrictMock<MockRecordStore> store;
    record::Record existing = make_record("alice");
    existing.metadata[store::DEFAULT_ROLE_KEY]["editor"] = true;
    record::Record fresh_one = make_record("bob", "");
    fresh_one.metadata["nickname"] = "b";

    EXPECT_CALL(store, find_by_key("alice")).WillOnce(Return(stored(4, "alice")));
    EXPECT_CALL(store, find_by_key("bob")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, find_by_key("carol")).WillOnce(Return(std::nullopt));
    // StrictMock fails the test on any create, update, set_metadata or clear_roles

    Reconciler reconciler(store, *log, options);
    ReconcileResult result = reconciler.apply({existing, fresh_one, make_record("carol")}, true);

    EXPECT_EQ(result.summary, (Summary{2, 1, 0}));
    EXPECT_EQ(*result.decisions[0].id, ResolvedId(RealId{4}));
    EXPECT_EQ(*result.decisions[1].id, ResolvedId(PendingId{1}));
    EXPECT_EQ(*result.decisions[2].id, ResolvedId(PendingId{2}));
    EXPECT_EQ(to_string(*result.decisions[2].id), "-2");

    EXPECT_EQ(result.decisions[0].metadata_keys, std::vector<std::string>{store::DEFAULT_ROLE_KEY});
    EXPECT_EQ(result.decisions[1].metadata_keys, std::vector<std::string>{"nickname"});
    EXPECT_TRUE(log_contains("DRY RUN: Would update existing record (ID: 4).", oplog::Severity::Info));
    EXPECT_TRUE(log_contains("DRY RUN: Would create new record (pending ID: -1).", oplog::Severity::Info));
    EXPECT_TRUE(log_contains("DRY RUN: Would update meta_key \"nickname\".", oplog::Severity::InfoDetail));
    EXPECT_TRUE(log_contains("DRY RUN: Would clear existing roles", oplog::Severity::InfoDetail));
}

TEST_F(ReconcilerTest, RoleKeyClearsRolesBeforeMetadata) {
    StrictMock<MockRecordStore> store;
    record::Record alice = make_record("alice");
    alice.metadata[store::DEFAULT_ROLE_KEY]["subscriber"] = true;
    alice.metadata["nickname"] = "al";

    EXPECT_CALL(store, find_by_key("alice")).WillOnce(Return(stored(5, "alice")));
    EXPECT_CALL(store, update(5, _));
    {
        InSequence seq;
        EXPECT_CALL(store, clear_roles(5));
        EXPECT_CALL(store, set_metadata(5, "nickname", Json::Value("al")));
        EXPECT_CALL(store, set_metadata(5, store::DEFAULT_ROLE_KEY, alice.metadata.at(store::DEFAULT_ROLE_KEY)));
    }

    Reconciler reconciler(store, *log, options);
    ReconcileResult result = reconciler.apply({alice}, false);
    EXPECT_EQ(result.decisions[0].metadata_keys.size(), 2u);
    EXPECT_EQ(result.decisions[0].metadata_failures, 0u);
}

TEST_F(ReconcilerTest, MetadataWithoutRoleKeyMerges) {
    StrictMock<MockRecordStore> store;
    record::Record alice = make_record("alice");
    alice.metadata["nickname"] = "al";

    EXPECT_CALL(store, find_by_key("alice")).WillOnce(Return(stored(5, "alice")));
    EXPECT_CALL(store, update(5, _));
    EXPECT_CALL(store, set_metadata(5, "nickname", Json::Value("al")));

    Reconciler reconciler(store, *log, options);
    reconciler.apply({alice}, false);
}

TEST_F(ReconcilerTest, ConfiguredRoleKey) {
    StrictMock<MockRecordStore> store;
    record::Record alice = make_record("alice");
    alice.metadata["roles"]["admin"] = true;

    EXPECT_CALL(store, find_by_key("alice")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, create(_)).WillOnce(Return(1));
    EXPECT_CALL(store, clear_roles(1));
    EXPECT_CALL(store, set_metadata(1, "roles", _));

    options.role_key = "roles";
    Reconciler reconciler(store, *log, options);
    reconciler.apply({alice}, false);
}

TEST_F(ReconcilerTest, MetadataFailuresAreCountedNotSkipped) {
    StrictMock<MockRecordStore> store;
    record::Record alice = make_record("alice");
    alice.metadata["a"] = 1;
    alice.metadata["b"] = 2;

    EXPECT_CALL(store, find_by_key("alice")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(store, create(_)).WillOnce(Return(9));
    EXPECT_CALL(store, set_metadata(9, "a", _)).WillOnce(Throw(store::StoreError("locked")));
    EXPECT_CALL(store, set_metadata(9, "b", _));

    Reconciler reconciler(store, *log, options);
    ReconcileResult result = reconciler.apply({alice}, false);

    EXPECT_EQ(result.summary, (Summary{1, 0, 0}));
    EXPECT_EQ(result.decisions[0].kind, DecisionKind::Created);
    EXPECT_EQ(result.decisions[0].metadata_failures, 1u);
    EXPECT_EQ(result.decisions[0].metadata_keys, std::vector<std::string>{"b"});
    EXPECT_TRUE(log_contains("Error updating meta_key \"a\": locked", oplog::Severity::Error));
}

TEST_F(ReconcilerTest, ReimportIsIdempotent) {
    store::MemoryRecordStore store;
    record::Record alice = make_record("alice");
    alice.attributes.email = "alice@example.com";
    alice.metadata[store::DEFAULT_ROLE_KEY]["editor"] = true;
    record::RecordList records = {alice, make_record("bob")};

    Reconciler reconciler(store, *log, options);
    ReconcileResult first = reconciler.apply(records, false);
    auto after_first = store.list();

    ReconcileResult second = reconciler.apply(records, false);
    auto after_second = store.list();

    EXPECT_EQ(first.summary, (Summary{2, 0, 0}));
    EXPECT_EQ(second.summary, (Summary{0, 2, 0}));
    ASSERT_EQ(after_first.size(), after_second.size());
    for (size_t i = 0; i < after_first.size(); ++i) {
        EXPECT_EQ(after_first[i].id, after_second[i].id);
        EXPECT_EQ(after_first[i].record, after_second[i].record);
    }
}

TEST_F(ReconcilerTest, RoleReplaceVersusMetadataMerge) {
    store::MemoryRecordStore store;
    store::RecordId id = store.create(make_record("alice"));
    Json::Value old_roles(Json::objectValue);
    old_roles["administrator"] = true;
    store.set_metadata(id, store::DEFAULT_ROLE_KEY, old_roles);
    store.set_metadata(id, "untouched", Json::Value("stays"));

    record::Record incoming = make_record("alice");
    incoming.metadata[store::DEFAULT_ROLE_KEY]["subscriber"] = true;
    incoming.metadata["nickname"] = "al";

    Reconciler reconciler(store, *log, options);
    reconciler.apply({incoming}, false);

    const auto& metadata = store.find_by_key("alice")->record.metadata;
    const Json::Value& roles = metadata.at(store::DEFAULT_ROLE_KEY);
    EXPECT_TRUE(roles["subscriber"].asBool());
    EXPECT_FALSE(roles.isMember("administrator"));
    EXPECT_EQ(metadata.at("untouched").asString(), "stays");
    EXPECT_EQ(metadata.at("nickname").asString(), "al");
}
