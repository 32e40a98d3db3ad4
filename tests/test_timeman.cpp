#include "timeman.h"
#include <gtest/gtest.h>

TEST(TimeManager, TurnDeadlineIsClamped) {
    EXPECT_EQ(TimeManager::turn_deadline(100000), TimeManager::MAX_DEADLINE_MS);
    EXPECT_EQ(TimeManager::turn_deadline(2500), 500);
    EXPECT_EQ(TimeManager::turn_deadline(1000), TimeManager::MIN_DEADLINE_MS);
    EXPECT_EQ(TimeManager::turn_deadline(0), TimeManager::MIN_DEADLINE_MS);
}

TEST(TimeManager, PanicReserveIsConfigurable) {
    TimeManager tm;
    tm.panic_reserve_ms = 500;
    tm.init(1500);
    EXPECT_EQ(tm.deadline_ms, 1000);
}

TEST(TimeManager, MovetimeOverridesClock) {
    TimeManager tm;
    tm.init(60000, 500);
    EXPECT_EQ(tm.deadline_ms, 500 - TimeManager::MOVE_OVERHEAD_MS);
}

TEST(TimeManager, NoClockMeansNoDeadline) {
    TimeManager tm;
    tm.init(0);
    EXPECT_EQ(tm.deadline_ms, TimeManager::NO_DEADLINE_MS);
    EXPECT_FALSE(tm.should_stop());
}

TEST(TimeManager, ExpiredDeadlineStops) {
    TimeManager tm;
    tm.init_fixed_deadline(0);
    EXPECT_TRUE(tm.should_stop());
    EXPECT_GE(tm.elapsed_ms(), 0);
}
