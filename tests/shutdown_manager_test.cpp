#include <gtest/gtest.h>
#include <thread>
#include <atomic>
#include <chrono>
#include <csignal>
#include "core/shutdown_manager.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        // Reset the ShutdownManager to a clean state before each test
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, ProgrammaticShutdownUnblocksWait)
{
    auto &mgr = ShutdownManager::getInstance();

    std::atomic<bool> unblocked{false};
    std::thread waiter([&]()
                       {
        mgr.waitForShutdown();
        unblocked.store(true); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(unblocked.load());
    mgr.requestShutdown("unit-test");

    waiter.join();
    ASSERT_TRUE(unblocked.load());
    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), 0);
    ASSERT_EQ(mgr.getReason(), "unit-test");
}

TEST_F(ShutdownManagerTest, RequestWithSignalNumber)
{
    auto &mgr = ShutdownManager::getInstance();
    ASSERT_FALSE(mgr.isShutdownRequested());

    mgr.requestShutdown("test-signal", SIGTERM);

    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), SIGTERM);
    ASSERT_EQ(mgr.getReason(), "test-signal");
}

TEST_F(ShutdownManagerTest, FirstRequestWins)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("first");
    mgr.requestShutdown("second", SIGINT);

    ASSERT_EQ(mgr.getReason(), "first");
    ASSERT_EQ(mgr.getSignalNumber(), 0);
}

TEST_F(ShutdownManagerTest, WaitReturnsImmediatelyAfterRequest)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("already");
    mgr.waitForShutdown();
    SUCCEED();
}
