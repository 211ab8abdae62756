#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "csync/foundation/common_adapter.hpp"

using namespace csync::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::NotAuthorized), "Session");
    EXPECT_EQ(errorSubsystem(ErrorCode::StaleCompletion), "Session");
    EXPECT_EQ(errorSubsystem(ErrorCode::PersistenceFailure), "Persistence");
    EXPECT_EQ(errorSubsystem(ErrorCode::MalformedSnapshot), "Codec");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidMessage), "Replication");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConnectionFailed), "Network");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConnectionPoolExhausted), "Database");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigInvalidValue), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobNotFound), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, CodeNames) {
    EXPECT_EQ(errorCodeName(ErrorCode::OperationInProgress), "OperationInProgress");
    EXPECT_EQ(errorCodeName(ErrorCode::PersistenceUnavailable), "PersistenceUnavailable");
}

// --- GameError tests ---

TEST(GameErrorTest, DefaultConstruction) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(GameErrorTest, CodeAndMessage) {
    GameError err(ErrorCode::SessionEnded, "save after end");
    EXPECT_EQ(err.code(), ErrorCode::SessionEnded);
    EXPECT_EQ(err.message(), "save after end");
    EXPECT_EQ(err.subsystem(), "Session");
    EXPECT_FALSE(err.isSuccess());
}

TEST(GameErrorTest, DescribeIncludesSubsystemAndCode) {
    GameError err(ErrorCode::PersistenceFailure, "disk full");
    EXPECT_EQ(err.describe(), "Persistence/PersistenceFailure: disk full");

    GameError bare(ErrorCode::NotAuthorized);
    EXPECT_EQ(bare.describe(), "Session/NotAuthorized");
}

TEST(GameErrorTest, WrapsCauseAsContext) {
    GameError cause(ErrorCode::QueryFailed, "syntax error");
    GameError err(ErrorCode::PersistenceFailure, cause.describe(), cause);
    ASSERT_TRUE(err.hasContext());
    const auto* inner = err.context<GameError>();
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->code(), ErrorCode::QueryFailed);
    EXPECT_EQ(err.context<int>(), nullptr);
}

// --- GameResult tests ---

TEST(GameResultTest, OkValue) {
    auto result = GameResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(GameResultTest, ErrorValue) {
    auto result = GameResult<int>::err(
        GameError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(GameResultTest, VoidError) {
    auto result = GameResult<void>::err(GameError(ErrorCode::NotConnected, "offline"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotConnected);
}

// --- StrongId / SessionId tests ---

TEST(StrongIdTest, DefaultInvalid) {
    PeerId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0u);
}

TEST(StrongIdTest, EqualityAndOrdering) {
    PeerId a(1), b(1), c(2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
}

TEST(StrongIdTest, HashWorks) {
    std::unordered_map<PeerId, std::string> map;
    map[PeerId(1)] = "peer";
    EXPECT_EQ(map[PeerId(1)], "peer");
    EXPECT_EQ(map.count(PeerId(2)), 0u);
}

TEST(SessionIdTest, EmptyIsInvalid) {
    SessionId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_FALSE(id.isCanonical());
}

TEST(SessionIdTest, CanonicalShape) {
    EXPECT_TRUE(SessionId("a1b2c3d4").isCanonical());
    EXPECT_FALSE(SessionId("A1B2C3D4").isCanonical());
    EXPECT_FALSE(SessionId("a1b2c3").isCanonical());
    EXPECT_FALSE(SessionId("missing").isCanonical());
    // Opaque ids are still valid.
    EXPECT_TRUE(SessionId("missing").isValid());
}

// --- Signal tests ---

TEST(SignalTest, SlotsRunInRegistrationOrder) {
    Signal<int> signal;
    std::vector<int> seen;
    signal.connect([&](int v) { seen.push_back(v); });
    signal.connect([&](int v) { seen.push_back(v * 10); });

    signal.emit(3);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], 3);
    EXPECT_EQ(seen[1], 30);
}

TEST(SignalTest, Disconnect) {
    Signal<> signal;
    int calls = 0;
    auto id = signal.connect([&]() { ++calls; });
    signal.emit();
    signal.disconnect(id);
    signal.emit();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(signal.slotCount(), 0u);
}

TEST(SignalTest, SlotMayDisconnectItself) {
    Signal<> signal;
    int calls = 0;
    Signal<>::SlotId id = 0;
    id = signal.connect([&]() {
        ++calls;
        signal.disconnect(id);
    });
    signal.emit();
    signal.emit();
    EXPECT_EQ(calls, 1);
}

TEST(ScopedConnectionTest, DisconnectsOnDestruction) {
    Signal<int> signal;
    int total = 0;
    {
        ScopedConnection<int> conn(signal, [&](int v) { total += v; });
        EXPECT_TRUE(conn.connected());
        signal.emit(2);
    }
    signal.emit(5);
    EXPECT_EQ(total, 2);
    EXPECT_EQ(signal.slotCount(), 0u);
}

TEST(ScopedConnectionTest, MoveTransfersOwnership) {
    Signal<> signal;
    ScopedConnection<> first(signal, []() {});
    ScopedConnection<> second(std::move(first));
    EXPECT_FALSE(first.connected());
    EXPECT_TRUE(second.connected());
    second.reset();
    EXPECT_EQ(signal.slotCount(), 0u);
}

// --- CompletionQueue tests ---

TEST(CompletionQueueTest, DrainRunsInFifoOrder) {
    CompletionQueue queue;
    std::vector<int> order;
    queue.post([&]() { order.push_back(1); });
    queue.post([&]() { order.push_back(2); });

    EXPECT_EQ(queue.pendingCount(), 2u);
    EXPECT_EQ(queue.drain(), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(queue.pendingCount(), 0u);
}

TEST(CompletionQueueTest, TasksPostedDuringDrainRunNextCycle) {
    CompletionQueue queue;
    int runs = 0;
    queue.post([&]() {
        ++runs;
        queue.post([&]() { ++runs; });
    });

    EXPECT_EQ(queue.drain(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(queue.drain(), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(CompletionQueueTest, ClosedQueueRefusesPosts) {
    CompletionQueue queue;
    int runs = 0;
    EXPECT_TRUE(queue.post([&]() { ++runs; }));
    queue.close();
    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(queue.post([&]() { ++runs; }));

    // Work queued before close still drains.
    queue.drain();
    EXPECT_EQ(runs, 1);
}

TEST(CompletionQueueTest, PostFromManyThreads) {
    CompletionQueue queue;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kPerThread; ++i) {
                queue.post([]() {});
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(queue.drain(), static_cast<std::size_t>(kThreads * kPerThread));
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("csync_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("test.yaml", R"(
autosave:
  enabled: true
  move_interval: 5
network:
  host: "127.0.0.1"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto moves = config.get<int>("autosave.move_interval");
    ASSERT_TRUE(moves.hasValue());
    EXPECT_EQ(moves.value(), 5);

    auto enabled = config.get<bool>("autosave.enabled");
    ASSERT_TRUE(enabled.hasValue());
    EXPECT_TRUE(enabled.value());

    auto host = config.get<std::string>("network.host");
    ASSERT_TRUE(host.hasValue());
    EXPECT_EQ(host.value(), "127.0.0.1");
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("{}").hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("value: hello").hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrFallsBackOnlyWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("loop:\n  tick_rate: fast\n").hasValue());

    auto port = config.getOr<int>("network.port", 19100);
    ASSERT_TRUE(port.hasValue());
    EXPECT_EQ(port.value(), 19100);

    auto tick = config.getOr<int>("loop.tick_rate", 20);
    EXPECT_TRUE(tick.hasError());
    EXPECT_EQ(tick.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYaml) {
    ConfigManager config;
    auto result = config.loadFromString("autosave: [unclosed");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("network.port", 9090);

    auto result = config.get<int>("network.port");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 9090);
    EXPECT_TRUE(config.hasKey("network.port"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("autosave.enabled", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<bool>("autosave.enabled", true);
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "autosave.enabled");
}

TEST_F(ConfigManagerTest, WatcherMayReadConfig) {
    ConfigManager config;
    bool seen = false;

    config.watch("autosave.enabled", [&](std::string_view key) {
        auto value = config.get<bool>(key);
        seen = value.hasValue() && !value.value();
    });

    config.set<bool>("autosave.enabled", false);
    EXPECT_TRUE(seen);
}
