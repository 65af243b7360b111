/**
 * @file test_scheduler.cpp
 * @brief Tests for the fixed-interval scheduler
 * @author DR Logger Test Team
 * @date 2026-10-19
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../cpp/include/scheduler.hpp"
#include "../cpp/include/exceptions.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace drLogger;
using namespace testing;

class SchedulerTest : public ::testing::Test {
protected:
    void TearDown() override {
        scheduler_.stop();
    }

    template<typename Predicate>
    bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return predicate();
    }

    Scheduler scheduler_{"test scheduler"};
    std::atomic<int> fired_{0};
};

// ============================================================================
// START / STOP
// ============================================================================

TEST_F(SchedulerTest, Start_FiresImmediately) {
    scheduler_.start(Duration(10000), [this] { fired_++; });

    EXPECT_TRUE(waitFor([this] { return fired_.load() == 1; }, std::chrono::milliseconds(500)))
        << "First firing must not wait for the interval";
    EXPECT_TRUE(scheduler_.isRunning());
}

TEST_F(SchedulerTest, Start_FiresRepeatedly) {
    scheduler_.start(Duration(10), [this] { fired_++; });

    EXPECT_TRUE(waitFor([this] { return fired_.load() >= 5; }));
    EXPECT_GE(scheduler_.getFireCount(), 4u);
}

TEST_F(SchedulerTest, Start_WhileRunning_ThrowsAlreadyRunning) {
    scheduler_.start(Duration(50), [this] { fired_++; });

    EXPECT_THROW(scheduler_.start(Duration(50), [] {}), AlreadyRunningException);
    EXPECT_TRUE(scheduler_.isRunning());
}

TEST_F(SchedulerTest, Start_InvalidArguments_Throw) {
    EXPECT_THROW(scheduler_.start(Duration(0), [] {}), ValidationException);
    EXPECT_THROW(scheduler_.start(Duration(10), Scheduler::Action()), ValidationException);
    EXPECT_FALSE(scheduler_.isRunning());
}

TEST_F(SchedulerTest, Stop_NoActionRunsAfterReturn) {
    scheduler_.start(Duration(5), [this] { fired_++; });
    ASSERT_TRUE(waitFor([this] { return fired_.load() >= 2; }));

    scheduler_.stop();
    EXPECT_FALSE(scheduler_.isRunning());

    int after_stop = fired_.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(fired_.load(), after_stop);
}

TEST_F(SchedulerTest, Stop_WaitsForInFlightAction) {
    std::atomic<bool> in_action{false};
    std::atomic<bool> entered{false};

    scheduler_.start(Duration(1000), [&] {
        in_action = true;
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        in_action = false;
    });
    ASSERT_TRUE(waitFor([&entered] { return entered.load(); }));

    scheduler_.stop();
    EXPECT_FALSE(in_action.load());
}

TEST_F(SchedulerTest, Stop_WhenNotRunning_IsHarmless) {
    EXPECT_NO_THROW(scheduler_.stop());
    EXPECT_NO_THROW(scheduler_.stop());
}

TEST_F(SchedulerTest, Stop_FromInsideAction_Throws) {
    std::atomic<bool> threw{false};
    scheduler_.start(Duration(1000), [&] {
        try {
            scheduler_.stop();
        } catch (const SchedulerException&) {
            threw = true;
        }
    });

    EXPECT_TRUE(waitFor([&threw] { return threw.load(); }));
    EXPECT_TRUE(scheduler_.isRunning());
}

TEST_F(SchedulerTest, Restart_AfterStop_FiresAgain) {
    scheduler_.start(Duration(1000), [this] { fired_++; });
    ASSERT_TRUE(waitFor([this] { return fired_.load() == 1; }));
    scheduler_.stop();

    scheduler_.start(Duration(1000), [this] { fired_++; });
    EXPECT_TRUE(waitFor([this] { return fired_.load() == 2; }));
}

// ============================================================================
// FIRING POLICY
// ============================================================================

TEST_F(SchedulerTest, Overrun_NoOverlappingInvocations) {
    std::atomic<int> concurrent{0};
    std::atomic<int> max_concurrent{0};

    scheduler_.start(Duration(1), [&] {
        int now = ++concurrent;
        if (now > max_concurrent.load()) {
            max_concurrent = now;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --concurrent;
        fired_++;
    });

    ASSERT_TRUE(waitFor([this] { return fired_.load() >= 5; }));
    scheduler_.stop();
    EXPECT_EQ(max_concurrent.load(), 1);
}

TEST_F(SchedulerTest, Overrun_MissedTicksAreNotReplayed) {
    scheduler_.start(Duration(20), [this] {
        if (fired_++ == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    // A 200ms action spans ten ticks; only one firing follows it right away
    ASSERT_TRUE(waitFor([this] { return fired_.load() >= 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_LE(fired_.load(), 3);
}

TEST_F(SchedulerTest, ActionThrows_LoopContinues) {
    scheduler_.start(Duration(5), [this] {
        fired_++;
        throw std::runtime_error("action failed");
    });

    EXPECT_TRUE(waitFor([this] { return fired_.load() >= 3; }));
    EXPECT_TRUE(scheduler_.isRunning());
}

// ============================================================================
// RECONFIGURE
// ============================================================================

TEST_F(SchedulerTest, Reconfigure_WhenIdle_OnlyStoresInterval) {
    scheduler_.reconfigure(Duration(250));

    EXPECT_EQ(scheduler_.getInterval(), Duration(250));
    EXPECT_FALSE(scheduler_.isRunning());
    EXPECT_EQ(scheduler_.getFireCount(), 0u);
}

TEST_F(SchedulerTest, Reconfigure_WhileRunning_KeepsActionAndAppliesInterval) {
    scheduler_.start(Duration(10000), [this] { fired_++; });
    ASSERT_TRUE(waitFor([this] { return fired_.load() == 1; }));

    scheduler_.reconfigure(Duration(5));

    EXPECT_TRUE(scheduler_.isRunning());
    EXPECT_EQ(scheduler_.getInterval(), Duration(5));
    EXPECT_TRUE(waitFor([this] { return fired_.load() >= 4; }))
        << "Same action must keep firing at the new interval";
}

TEST_F(SchedulerTest, Reconfigure_NotPositive_Throws) {
    scheduler_.start(Duration(50), [this] { fired_++; });

    EXPECT_THROW(scheduler_.reconfigure(Duration(-1)), ValidationException);
    EXPECT_TRUE(scheduler_.isRunning());
    EXPECT_EQ(scheduler_.getInterval(), Duration(50));
}
