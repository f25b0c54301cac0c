#include <gtest/gtest.h>

#include <memory>

#include "blob_store.hpp"
#include "focus_controller.hpp"

namespace {

const Timestamp kT0{Millis{1'773'140'400'000}};
const std::string kKey = "calendar-storage";

// Rejects every write, as a full disk or locked database would.
class FailingStore : public BlobStore {
  public:
    std::optional<std::string> Read(const std::string &) override {
        return std::nullopt;
    }
    bool Write(const std::string &, const std::string &, std::string &error) override {
        ++writes;
        error = "disk full";
        return false;
    }
    std::vector<std::string> PollChangedKeys() override {
        return {};
    }

    int writes = 0;
};

class FocusControllerTest : public ::testing::Test {
  protected:
    FocusControllerTest()
        : bus(std::make_shared<MemoryBlobBus>()), store(bus), bridge(store, kKey),
          focus(clock, SessionDurations{}, &bridge) {
    }

    ManualClock clock{kT0};
    std::shared_ptr<MemoryBlobBus> bus;
    MemoryBlobStore store;
    SyncBridge bridge;
    FocusController focus;
};

} // namespace

TEST_F(FocusControllerTest, EveryStateChangeIsPersisted) {
    focus.Start("T");
    EXPECT_EQ(bus->records[kKey].revision, 1);
    clock.Advance(Millis{1000});
    focus.PauseOrResume();
    EXPECT_EQ(bus->records[kKey].revision, 2);
    focus.Stop();
    EXPECT_EQ(bus->records[kKey].revision, 3);
}

TEST_F(FocusControllerTest, NoOpsDoNotWrite) {
    focus.PauseOrResume();
    focus.CompleteBreak();
    focus.Tick();
    EXPECT_EQ(bus->records.count(kKey), 0u);
}

TEST_F(FocusControllerTest, SignalsFireAfterStateIsPersisted) {
    BlobCodec codec;
    int signals = 0;
    FocusListener listener;
    listener.onSessionCompleted = [&](const SessionCompleted &done) {
        ++signals;
        EXPECT_EQ(done.sessionsCompletedToday, 1);
        const auto stored = codec.Decode(bus->records[kKey].value);
        ASSERT_TRUE(stored.has_value());
        EXPECT_EQ(stored->session.phase, Phase::Break);
        EXPECT_EQ(stored->ledger.Size(), 1u);
    };
    focus.SetListener(listener);

    focus.Start("T");
    clock.Advance(std::chrono::minutes(25));
    focus.Tick();
    EXPECT_EQ(signals, 1);

    // Further ticks during the break do not repeat the signal.
    clock.Advance(std::chrono::minutes(1));
    focus.Tick();
    EXPECT_EQ(signals, 1);
}

TEST_F(FocusControllerTest, ManualCompleteWorkSignalsToo) {
    int signals = 0;
    FocusListener listener;
    listener.onSessionCompleted = [&](const SessionCompleted &) { ++signals; };
    focus.SetListener(listener);

    focus.Start(std::nullopt);
    clock.Advance(Millis{3000});
    focus.CompleteWork();
    EXPECT_EQ(signals, 1);
    EXPECT_TRUE(focus.GetLedger().Empty());
}

TEST_F(FocusControllerTest, SleptThroughDeadlineCompletesOnWake) {
    focus.Start("T");
    clock.Advance(std::chrono::hours(3));
    focus.Tick();
    EXPECT_EQ(focus.CurrentSession().phase, Phase::Break);
    ASSERT_EQ(focus.GetLedger().Size(), 1u);
    EXPECT_EQ(focus.GetLedger().Entries()[0].duration, std::chrono::hours(3));
}

TEST_F(FocusControllerTest, TaskCommands) {
    std::string error;
    MemoryBlobStore raw(bus);
    ASSERT_TRUE(raw.Write(kKey, R"({"tasks": [{"id": "T", "title": "Report"}]})", error));

    EXPECT_TRUE(focus.SetTaskCompleted("T", true));
    ASSERT_NE(focus.Board().FindTask("T"), nullptr);
    EXPECT_TRUE(focus.Board().FindTask("T")->completed);
    EXPECT_FALSE(focus.SetTaskCompleted("missing", true));
    EXPECT_FALSE(focus.DeleteTask("missing"));
}

TEST_F(FocusControllerTest, FailedWriteKeepsStateInMemory) {
    FailingStore failing;
    SyncBridge failingBridge(failing, kKey);
    FocusController local(clock, SessionDurations{}, &failingBridge);

    local.Start("T");
    clock.Advance(Millis{6000});
    local.Stop();
    EXPECT_EQ(failing.writes, 2);
    EXPECT_EQ(local.GetLedger().Size(), 1u);
    EXPECT_EQ(local.CurrentSession().phase, Phase::Idle);
}

TEST_F(FocusControllerTest, WorksWithoutBridge) {
    FocusController local(clock, SessionDurations{});
    EXPECT_FALSE(local.Hydrate());
    EXPECT_FALSE(local.Sync());
    local.Start("T");
    clock.Advance(Millis{6000});
    EXPECT_EQ(local.TimeForTask("T"), Millis{6000});
    EXPECT_EQ(local.Remaining(), kDefaultWorkDuration - Millis{6000});
}
