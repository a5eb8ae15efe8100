#include <gtest/gtest.h>
#include "adapters/secondary/ExpirySweeper.hpp"
#include "adapters/secondary/MemorySessionStore.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace websession::adapters::secondary;
using namespace websession::domain;
using namespace std::chrono_literals;

// ================================================================
// BASIC LIFECYCLE
// ================================================================

TEST(ExpirySweeperTest, StartStop_Basic) {
    ExpirySweeper sweeper([]() { return size_t{0}; });

    EXPECT_FALSE(sweeper.isRunning());

    sweeper.start(10ms);
    EXPECT_TRUE(sweeper.isRunning());

    std::this_thread::sleep_for(50ms);

    sweeper.stop();
    EXPECT_FALSE(sweeper.isRunning());
    EXPECT_GT(sweeper.sweepCount(), 0u);
}

TEST(ExpirySweeperTest, DoubleStartStop_NoOp) {
    ExpirySweeper sweeper([]() { return size_t{0}; });

    sweeper.start(10ms);
    sweeper.start(10ms);  // Второй вызов игнорируется
    EXPECT_TRUE(sweeper.isRunning());

    sweeper.stop();
    sweeper.stop();  // Второй вызов игнорируется
    EXPECT_FALSE(sweeper.isRunning());
}

TEST(ExpirySweeperTest, Stop_DoesNotWaitForLongInterval) {
    ExpirySweeper sweeper([]() { return size_t{0}; });
    sweeper.start(std::chrono::hours(1));

    auto begin = std::chrono::steady_clock::now();
    sweeper.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 1s);
    EXPECT_EQ(sweeper.sweepCount(), 0u);
}

TEST(ExpirySweeperTest, DestructorStops) {
    auto sweeper = std::make_unique<ExpirySweeper>([]() { return size_t{0}; });
    sweeper->start(10ms);

    sweeper.reset();  // Деструктор должен остановить без зависания
}

// ================================================================
// PURGING
// ================================================================

TEST(ExpirySweeperTest, SweepOnce_PurgesExpiredSessions) {
    auto store = std::make_shared<MemorySessionStore>(1ms);
    store->save(SessionRecord(SessionId(std::string(43, 'a')), "{}"));
    store->save(SessionRecord(SessionId(std::string(43, 'b')), "{}"));
    std::this_thread::sleep_for(5ms);

    ExpirySweeper sweeper([store]() { return store->purgeExpired(); });

    EXPECT_EQ(sweeper.sweepOnce(), 2u);
    EXPECT_EQ(sweeper.purgedTotal(), 2u);
    EXPECT_EQ(store->size(), 0u);
}

TEST(ExpirySweeperTest, FailingPurge_KeepsThreadAlive) {
    std::atomic<int> calls{0};
    ExpirySweeper sweeper([&calls]() -> size_t {
        ++calls;
        throw std::runtime_error("backend down");
    });

    sweeper.start(5ms);
    std::this_thread::sleep_for(50ms);

    EXPECT_TRUE(sweeper.isRunning());
    EXPECT_GT(calls.load(), 1);
    sweeper.stop();
}

TEST(ExpirySweeperTest, Constructor_RejectsEmptyFunction) {
    EXPECT_THROW(ExpirySweeper(PurgeFunction{}), std::invalid_argument);
}

TEST(ExpirySweeperTest, RepeatedStartStop_NeverWaitsForInterval) {
    ExpirySweeper sweeper([]() { return size_t{0}; });

    auto begin = std::chrono::steady_clock::now();
    for (int i = 0; i < 200; ++i) {
        sweeper.start(std::chrono::seconds(30));
        sweeper.stop();
    }

    EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
    EXPECT_EQ(sweeper.sweepCount(), 0u);
}
