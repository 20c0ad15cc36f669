#include <gtest/gtest.h>

#include <algorithm>

#include "actuator_map.h"
#include "config.h"
#include "dispense_controller.h"
#include "fakes.h"
#include "relay_driver.h"

class DispenseControllerTest : public ::testing::Test {
protected:
    DispenseControllerTest()
        : map(ActuatorMap::fromTable(SLOT_BINDINGS, NUM_SLOT_BINDINGS)),
          dispenser(map, relays, runner, sleeper.fn(), DISPENSE_DWELL_MS) {
        attachFakeRelays(relays, board);
        sleeper.onSleep = [this](uint32_t) { engagedDuringHold.push_back(board.engaged()); };
    }

    static std::vector<int> sorted(std::vector<int> channels) {
        std::sort(channels.begin(), channels.end());
        return channels;
    }

    FakeBoard        board;
    RelayDriver      relays;
    ActuatorMap      map;
    InlineTaskRunner runner;
    RecordingSleeper sleeper;
    DispenseController dispenser;

    std::vector<std::vector<int> > engagedDuringHold;
};

TEST_F(DispenseControllerTest, EngagesHoldsAndReleasesTheSlotChannels) {
    ASSERT_TRUE(dispenser.dispense("B3"));

    std::vector<int> expected;
    ASSERT_TRUE(map.lookup("B3", expected));

    ASSERT_EQ(1u, engagedDuringHold.size());
    EXPECT_EQ(sorted(expected), engagedDuringHold[0]);
    EXPECT_EQ(std::vector<uint32_t>{DISPENSE_DWELL_MS}, sleeper.holds());
    EXPECT_TRUE(board.allIdle());
    EXPECT_EQ(0, dispenser.activeCycles());
    EXPECT_EQ(std::vector<std::string>{"dispense"}, runner.names);
}

TEST_F(DispenseControllerTest, EveryEngagedChannelIsLaterReleased) {
    ASSERT_TRUE(dispenser.dispense("D5"));

    auto writes = board.writes();
    size_t lowered = 0;
    for (size_t i = 0; i < writes.size(); i++) {
        if (writes[i].second != FakeBoard::LOW) continue;
        lowered++;
        bool releasedLater = false;
        for (size_t j = i + 1; j < writes.size(); j++) {
            if (writes[j].first == writes[i].first && writes[j].second == FakeBoard::HIGH) {
                releasedLater = true;
            }
        }
        EXPECT_TRUE(releasedLater) << "channel " << writes[i].first;
    }
    EXPECT_EQ(8u, lowered);
    EXPECT_TRUE(board.allIdle());
}

TEST_F(DispenseControllerTest, UnknownSlotDoesNothing) {
    size_t writes = board.writeCount();

    EXPECT_FALSE(dispenser.dispense("Z9"));
    EXPECT_FALSE(dispenser.dispense(""));
    EXPECT_FALSE(dispenser.dispense("b3"));

    EXPECT_EQ(writes, board.writeCount());
    EXPECT_TRUE(sleeper.holds().empty());
    EXPECT_TRUE(runner.names.empty());
}

TEST_F(DispenseControllerTest, MissingChannelStillReleasesTheOthers) {
    ActuatorMap broken;
    broken.addSlot("X1", {2, 40, 14});
    DispenseController brokenDispenser(broken, relays, runner, sleeper.fn(), 50);

    ASSERT_TRUE(brokenDispenser.dispense("X1"));
    ASSERT_EQ(1u, engagedDuringHold.size());
    EXPECT_EQ((std::vector<int>{2, 14}), engagedDuringHold[0]);
    EXPECT_EQ(std::vector<uint32_t>{50}, sleeper.holds());
    EXPECT_TRUE(board.allIdle());
}

TEST_F(DispenseControllerTest, NoCycleWhenTaskCannotStart) {
    runner.refuse = true;
    size_t writes = board.writeCount();

    EXPECT_FALSE(dispenser.dispense("A1"));
    EXPECT_EQ(writes, board.writeCount());
    EXPECT_EQ(0, dispenser.activeCycles());
}

TEST_F(DispenseControllerTest, PulseUsesTheGivenHold) {
    ASSERT_TRUE(dispenser.pulse("manual relays", {1, 9}, MANUAL_RELAY_HOLD_MS));

    ASSERT_EQ(1u, engagedDuringHold.size());
    EXPECT_EQ((std::vector<int>{1, 9}), engagedDuringHold[0]);
    EXPECT_EQ(std::vector<uint32_t>{MANUAL_RELAY_HOLD_MS}, sleeper.holds());
    EXPECT_FALSE(dispenser.pulse("nothing", {}, 100));
}

TEST(DispenseControllerThreadTest, DispenseReturnsBeforeTheCycleEnds) {
    FakeBoard board;
    RelayDriver relays;
    ASSERT_TRUE(attachFakeRelays(relays, board));
    ActuatorMap map = ActuatorMap::fromTable(SLOT_BINDINGS, NUM_SLOT_BINDINGS);
    ThreadTaskRunner runner;

    std::mutex gate;
    gate.lock();
    SleepFn sleep = [&gate](uint32_t) {
        std::lock_guard<std::mutex> lock(gate);
    };
    DispenseController dispenser(map, relays, runner, sleep, DISPENSE_DWELL_MS);

    ASSERT_TRUE(dispenser.dispense("A2"));
    ASSERT_TRUE(dispenser.dispense("C4"));

    // Both cycles are parked in their hold
    while (dispenser.activeCycles() != 2 || board.engaged().size() != 6) {
        std::this_thread::yield();
    }
    gate.unlock();
    runner.join();

    EXPECT_EQ(0, dispenser.activeCycles());
    EXPECT_TRUE(board.allIdle());
}
