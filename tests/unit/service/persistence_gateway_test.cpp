/// @file persistence_gateway_test.cpp
/// @brief Unit tests for PersistenceGateway, MemorySessionStore and the
///        SQL side of DatabaseSessionStore.

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "csync/foundation/completion_queue.hpp"
#include "csync/foundation/game_database.hpp"
#include "csync/foundation/job_scheduler.hpp"
#include "csync/service/database_session_store.hpp"
#include "csync/service/memory_session_store.hpp"
#include "csync/service/persistence_gateway.hpp"

using namespace csync::service;
using namespace csync::foundation;

namespace {

const std::string kDoc =
    R"({"pieces":[{"pieceType":"King","color":"White","position":"e1"}]})";

/// Store that misbehaves in ways the memory store cannot.
class RogueStore final : public ISessionStore {
public:
    bool isReady() const override { return true; }

    void write(SaveRecord, WriteCallback callback) override {
        callback(GameResult<void>::ok());
        if (doubleComplete) {
            callback(GameResult<void>::ok());
        }
    }

    void read(const SessionId&, ReadCallback callback) override {
        callback(GameResult<std::optional<SaveRecord>>::ok(readBack));
    }

    bool doubleComplete = false;
    std::optional<SaveRecord> readBack;
};

}  // namespace

// ===========================================================================
// Fixture
// ===========================================================================

class PersistenceGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway_.setClock([] { return int64_t{1700000000123456}; });
    }

    std::optional<GameResult<void>> saveNow(const std::string& id, std::string payload) {
        std::optional<GameResult<void>> out;
        gateway_.save(SessionId(id), std::move(payload),
                      [&out](GameResult<void> r) { out = std::move(r); });
        return out;
    }

    std::optional<GameResult<LoadOutcome>> loadNow(const std::string& id) {
        std::optional<GameResult<LoadOutcome>> out;
        gateway_.load(SessionId(id), [&out](GameResult<LoadOutcome> r) { out = std::move(r); });
        return out;
    }

    MemorySessionStore store_;
    PersistenceGateway gateway_{store_};
};

// ===========================================================================
// Save
// ===========================================================================

TEST_F(PersistenceGatewayTest, SaveStoresStampedRecord) {
    auto result = saveNow("a1b2c3d4", kDoc);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->hasValue());

    auto record = store_.find(SessionId("a1b2c3d4"));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->payload, kDoc);
    EXPECT_EQ(record->timestampUs, 1700000000123456);
    EXPECT_EQ(store_.writeCount(), 1u);
}

TEST_F(PersistenceGatewayTest, SaveOverwritesSameSession) {
    ASSERT_TRUE(saveNow("a1b2c3d4", kDoc)->hasValue());
    ASSERT_TRUE(saveNow("a1b2c3d4", R"({"pieces":[]})")->hasValue());

    EXPECT_EQ(store_.recordCount(), 1u);
    EXPECT_EQ(store_.find(SessionId("a1b2c3d4"))->payload, R"({"pieces":[]})");
}

TEST_F(PersistenceGatewayTest, SaveWhenNotReadyNeverTouchesStore) {
    store_.setReady(false);
    EXPECT_FALSE(gateway_.isReady());

    auto result = saveNow("a1b2c3d4", kDoc);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::PersistenceUnavailable);
    EXPECT_EQ(store_.recordCount(), 0u);
}

TEST_F(PersistenceGatewayTest, SaveRejectsEmptyIdOrPayload) {
    auto noId = saveNow("", kDoc);
    ASSERT_TRUE(noId->hasError());
    EXPECT_EQ(noId->error().code(), ErrorCode::InvalidArgument);

    auto noPayload = saveNow("a1b2c3d4", "");
    ASSERT_TRUE(noPayload->hasError());
    EXPECT_EQ(noPayload->error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(store_.writeCount(), 0u);
}

TEST_F(PersistenceGatewayTest, StoreErrorBecomesPersistenceFailureWithCause) {
    store_.setWriteFailure(GameError(ErrorCode::QueryFailed, "disk full"));

    auto result = saveNow("a1b2c3d4", kDoc);
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::PersistenceFailure);

    const auto* cause = result->error().context<GameError>();
    ASSERT_NE(cause, nullptr);
    EXPECT_EQ(cause->code(), ErrorCode::QueryFailed);
    EXPECT_EQ(cause->message(), "disk full");
    EXPECT_EQ(store_.recordCount(), 0u);
}

TEST_F(PersistenceGatewayTest, StoreExceptionBecomesPersistenceFailure) {
    store_.throwOnNextCall();

    auto result = saveNow("a1b2c3d4", kDoc);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::PersistenceFailure);

    // Only the next call throws.
    EXPECT_TRUE(saveNow("a1b2c3d4", kDoc)->hasValue());
}

TEST_F(PersistenceGatewayTest, DeferredSaveCommitsOnCompletion) {
    store_.setDeferred(true);

    std::optional<GameResult<void>> result;
    gateway_.save(SessionId("a1b2c3d4"), kDoc,
                  [&result](GameResult<void> r) { result = std::move(r); });

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(store_.recordCount(), 0u);
    EXPECT_EQ(store_.pendingCount(), 1u);

    EXPECT_EQ(store_.completePending(), 1u);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->hasValue());
    EXPECT_EQ(store_.recordCount(), 1u);
}

TEST(PersistenceGatewayRogueTest, SecondStoreCompletionIsIgnored) {
    RogueStore store;
    store.doubleComplete = true;
    PersistenceGateway gateway(store);

    int calls = 0;
    gateway.save(SessionId("a1b2c3d4"), kDoc, [&calls](GameResult<void>) { ++calls; });
    EXPECT_EQ(calls, 1);
}

// ===========================================================================
// Load
// ===========================================================================

TEST_F(PersistenceGatewayTest, LoadReturnsSavedPayload) {
    ASSERT_TRUE(saveNow("a1b2c3d4", kDoc)->hasValue());

    auto result = loadNow("a1b2c3d4");
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->hasValue());
    EXPECT_TRUE(result->value().found);
    EXPECT_EQ(result->value().payload, kDoc);
}

TEST_F(PersistenceGatewayTest, LoadUnknownIdIsNotFound) {
    auto result = loadNow("ffffffff");
    ASSERT_TRUE(result->hasValue());
    EXPECT_FALSE(result->value().found);
    EXPECT_TRUE(result->value().payload.empty());
}

TEST_F(PersistenceGatewayTest, LoadWhenNotReady) {
    store_.setReady(false);
    auto result = loadNow("a1b2c3d4");
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::PersistenceUnavailable);
    EXPECT_EQ(store_.readCount(), 0u);
}

TEST_F(PersistenceGatewayTest, LoadStoreErrorIsWrapped) {
    store_.setReadFailure(GameError(ErrorCode::NotConnected, "gone"));
    auto result = loadNow("a1b2c3d4");
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::PersistenceFailure);
    ASSERT_NE(result->error().context<GameError>(), nullptr);
    EXPECT_EQ(result->error().context<GameError>()->code(), ErrorCode::NotConnected);
}

TEST_F(PersistenceGatewayTest, LoadExceptionIsWrapped) {
    store_.throwOnNextCall();
    auto result = loadNow("a1b2c3d4");
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::PersistenceFailure);
}

TEST_F(PersistenceGatewayTest, LoadEmptyIdIsInvalid) {
    auto result = loadNow("");
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::InvalidArgument);
}

TEST(PersistenceGatewayRogueTest, RecordForAnotherSessionIsRejected) {
    RogueStore store;
    store.readBack = SaveRecord{SessionId("00000000"), kDoc, 1};
    PersistenceGateway gateway(store);

    std::optional<GameResult<LoadOutcome>> result;
    gateway.load(SessionId("a1b2c3d4"),
                 [&result](GameResult<LoadOutcome> r) { result = std::move(r); });
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::PersistenceFailure);
}

TEST(PersistenceGatewayRogueTest, EmptyPayloadIsRejected) {
    RogueStore store;
    store.readBack = SaveRecord{SessionId("a1b2c3d4"), "", 1};
    PersistenceGateway gateway(store);

    std::optional<GameResult<LoadOutcome>> result;
    gateway.load(SessionId("a1b2c3d4"),
                 [&result](GameResult<LoadOutcome> r) { result = std::move(r); });
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::PersistenceFailure);
}

// ===========================================================================
// MemorySessionStore
// ===========================================================================

TEST(MemorySessionStoreTest, PutAndFindBypassSettings) {
    MemorySessionStore store;
    store.setReady(false);
    store.put(SaveRecord{SessionId("a1b2c3d4"), kDoc, 5});
    ASSERT_TRUE(store.find(SessionId("a1b2c3d4")).has_value());
    EXPECT_FALSE(store.find(SessionId("b1b2c3d4")).has_value());
    EXPECT_EQ(store.writeCount(), 0u);
}

TEST(MemorySessionStoreTest, DeferredCompletionsRunInIssueOrder) {
    MemorySessionStore store;
    store.setDeferred(true);

    std::string order;
    store.write(SaveRecord{SessionId("a1b2c3d4"), "one", 1},
                [&order](GameResult<void>) { order += "w1"; });
    store.read(SessionId("a1b2c3d4"),
               [&order](GameResult<std::optional<SaveRecord>> r) {
                   order += (r.hasValue() && r.value()) ? "r+" : "r-";
               });
    store.write(SaveRecord{SessionId("a1b2c3d4"), "two", 2},
                [&order](GameResult<void>) { order += "w2"; });

    EXPECT_EQ(store.completePending(), 3u);
    EXPECT_EQ(order, "w1r+w2");
    EXPECT_EQ(store.find(SessionId("a1b2c3d4"))->payload, "two");
    EXPECT_EQ(store.completePending(), 0u);
}

// ===========================================================================
// DatabaseSessionStore
// ===========================================================================

TEST(DatabaseSessionStoreSqlTest, CreateTable) {
    EXPECT_EQ(DatabaseSessionStore::createTableSql(),
              "CREATE TABLE IF NOT EXISTS game_states (session_id VARCHAR(64) PRIMARY KEY,"
              " state TEXT NOT NULL, timestamp_us BIGINT NOT NULL)");
}

TEST(DatabaseSessionStoreSqlTest, UpsertPerBackend) {
    auto pg = DatabaseSessionStore::upsertSql(DatabaseType::PostgreSQL);
    EXPECT_NE(pg.find("ON CONFLICT (session_id) DO UPDATE"), std::string::npos);
    EXPECT_EQ(pg, DatabaseSessionStore::upsertSql(DatabaseType::SQLite));

    auto my = DatabaseSessionStore::upsertSql(DatabaseType::MySQL);
    EXPECT_NE(my.find("ON DUPLICATE KEY UPDATE"), std::string::npos);
    EXPECT_EQ(my.find("ON CONFLICT"), std::string::npos);
}

TEST(DatabaseSessionStoreSqlTest, UpsertResolvesEveryParameter) {
    PreparedStatement stmt(DatabaseSessionStore::upsertSql(DatabaseType::PostgreSQL));
    stmt.bindString("session_id", "a1b2c3d4")
        .bindString("state", "{\"pieces\":[]}")
        .bindInt("timestamp_us", 42);

    auto sql = stmt.resolve();
    EXPECT_EQ(sql.find('$'), std::string::npos);
    EXPECT_NE(sql.find("VALUES ('a1b2c3d4', '{\"pieces\":[]}', 42)"), std::string::npos);
}

TEST(DatabaseSessionStoreSqlTest, SelectByPrimaryKey) {
    EXPECT_EQ(DatabaseSessionStore::selectSql(),
              "SELECT session_id, state, timestamp_us FROM game_states"
              " WHERE session_id = $session_id");
}

TEST(DatabaseSessionStoreTest, OpenWithoutConnectionFails) {
    GameDatabase db;
    GameJobScheduler jobs(1);
    CompletionQueue completions;
    DatabaseSessionStore store(db, jobs, completions);

    auto opened = store.open();
    ASSERT_TRUE(opened.hasError());
    EXPECT_EQ(opened.error().code(), ErrorCode::NotConnected);
    EXPECT_FALSE(store.isReady());
}

TEST(DatabaseSessionStoreTest, CompletionArrivesThroughQueue) {
    GameDatabase db;
    GameJobScheduler jobs(1);
    CompletionQueue completions;
    DatabaseSessionStore store(db, jobs, completions);

    std::optional<GameResult<void>> result;
    store.write(SaveRecord{SessionId("a1b2c3d4"), kDoc, 1},
                [&result](GameResult<void> r) { result = std::move(r); });

    jobs.waitAll();
    // Nothing reaches the caller until the session thread drains.
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(completions.drain(), 1u);

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::NotConnected);
}

TEST(DatabaseSessionStoreTest, ReadFailureArrivesThroughQueue) {
    GameDatabase db;
    GameJobScheduler jobs(1);
    CompletionQueue completions;
    DatabaseSessionStore store(db, jobs, completions);

    std::optional<GameResult<std::optional<SaveRecord>>> result;
    store.read(SessionId("a1b2c3d4"),
               [&result](GameResult<std::optional<SaveRecord>> r) { result = std::move(r); });

    jobs.waitAll();
    completions.drain();

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->hasError());
    EXPECT_EQ(result->error().code(), ErrorCode::NotConnected);
}

TEST(DatabaseSessionStoreTest, ThrowingDriverCallBecomesDatabaseError) {
    auto result = DatabaseSessionStore::guarded<void>("session write", []() -> GameResult<void> {
        throw std::runtime_error("driver lost the socket");
    });

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DatabaseError);
    EXPECT_NE(result.error().message().find("session write failed"), std::string::npos);
    EXPECT_NE(result.error().message().find("driver lost the socket"), std::string::npos);
}

TEST(DatabaseSessionStoreTest, GuardedPassesResultThrough) {
    auto result = DatabaseSessionStore::guarded<std::optional<SaveRecord>>(
        "session read", []() { return GameResult<std::optional<SaveRecord>>::ok(std::nullopt); });

    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().has_value());
}
