#include <gtest/gtest.h>

#include <memory>

#include "blob_store.hpp"
#include "focus_controller.hpp"
#include "sync_bridge.hpp"

namespace {

const Timestamp kT0{Millis{1'773'140'400'000}};
const std::string kKey = "calendar-storage";

// Two surfaces sharing one in-memory store: the main view drives the timer, the widget
// mirrors it.
class SyncBridgeTest : public ::testing::Test {
  protected:
    SyncBridgeTest()
        : bus(std::make_shared<MemoryBlobBus>()), mainStore(bus), widgetStore(bus),
          mainBridge(mainStore, kKey), widgetBridge(widgetStore, kKey),
          main(clock, SessionDurations{}, &mainBridge, true),
          widget(clock, SessionDurations{}, &widgetBridge, false) {
        FocusListener mainListener;
        mainListener.onExternalChange = [this] { ++mainExternal; };
        main.SetListener(mainListener);

        FocusListener widgetListener;
        widgetListener.onExternalChange = [this] { ++widgetExternal; };
        widget.SetListener(widgetListener);
    }

    void At(long long ms) {
        clock.Set(kT0 + Millis{ms});
    }

    ManualClock clock{kT0};
    std::shared_ptr<MemoryBlobBus> bus;
    MemoryBlobStore mainStore;
    MemoryBlobStore widgetStore;
    SyncBridge mainBridge;
    SyncBridge widgetBridge;
    FocusController main;
    FocusController widget;
    int mainExternal = 0;
    int widgetExternal = 0;
};

} // namespace

TEST_F(SyncBridgeTest, OtherSurfaceSeesWriteButWriterDoesNot) {
    main.Start("T");

    EXPECT_FALSE(main.Sync());
    EXPECT_EQ(mainExternal, 0);

    EXPECT_TRUE(widget.Sync());
    EXPECT_EQ(widgetExternal, 1);
    EXPECT_EQ(widget.CurrentSession(), main.CurrentSession());

    // Nothing new since the last refresh.
    EXPECT_FALSE(widget.Sync());
    EXPECT_EQ(widgetExternal, 1);
}

TEST_F(SyncBridgeTest, WidgetCommandReachesMain) {
    main.Start("T");
    At(12'000);
    widget.PauseOrResume();
    EXPECT_TRUE(widget.CurrentSession().paused);
    EXPECT_EQ(widget.CurrentSession().pausedElapsed, Millis{12'000});

    EXPECT_TRUE(main.Sync());
    EXPECT_TRUE(main.CurrentSession().paused);
    EXPECT_EQ(main.TimeForTask("T"), Millis{12'000});
}

TEST_F(SyncBridgeTest, CommandsActOnFreshestState) {
    main.Start("T");
    At(20'000);
    // The widget has not refreshed yet; its stop must still see the running session.
    widget.Stop();
    ASSERT_EQ(widget.GetLedger().Size(), 1u);
    EXPECT_EQ(widget.GetLedger().Entries()[0].duration, Millis{20'000});

    // The main surface stops a moment later and finds nothing left to record.
    main.Stop();
    EXPECT_EQ(main.GetLedger().Size(), 1u);
    EXPECT_EQ(main.CurrentSession().phase, Phase::Idle);
}

TEST_F(SyncBridgeTest, SimultaneousStopsAddAtMostOneExtraEntry) {
    main.Start("T");
    At(30'000);
    ASSERT_TRUE(widget.Sync());

    // Both surfaces act on the same snapshot before seeing each other's write.
    SessionMachine machine;
    FocusSnapshot a = main.Snapshot();
    FocusSnapshot b = widget.Snapshot();
    for (FocusSnapshot *s : {&a, &b}) {
        Transition t = machine.Stop(s->session, clock.Now());
        s->session = t.session;
        for (auto &effect : t.effects) {
            if (auto *append = std::get_if<AppendEntry>(&effect)) {
                s->ledger.Append(append->entry);
            }
        }
    }
    ASSERT_TRUE(mainBridge.Persist(a));
    ASSERT_TRUE(widgetBridge.Persist(b));

    ASSERT_TRUE(main.Sync());
    EXPECT_LE(main.GetLedger().Size(), 2u);
    EXPECT_GE(main.GetLedger().Size(), 1u);
    EXPECT_EQ(main.CurrentSession().phase, Phase::Idle);
}

TEST_F(SyncBridgeTest, MalformedBlobIsSkipped) {
    main.Start("T");
    ASSERT_TRUE(widget.Sync());
    const Session before = widget.CurrentSession();

    MemoryBlobStore raw(bus);
    std::string error;
    ASSERT_TRUE(raw.Write(kKey, "{\"session\": ", error));

    EXPECT_FALSE(widget.Sync());
    EXPECT_EQ(widget.CurrentSession(), before);
    EXPECT_EQ(widgetExternal, 1);

    // The next good write is picked up as usual.
    At(10'000);
    main.PauseOrResume();
    EXPECT_TRUE(widget.Sync());
    EXPECT_TRUE(widget.CurrentSession().paused);
}

TEST_F(SyncBridgeTest, PersistDuringHydrationIsDropped) {
    main.Start("T");

    bool applied = false;
    EXPECT_TRUE(widgetBridge.PollExternal([&](FocusSnapshot snapshot) {
        EXPECT_TRUE(widgetBridge.Hydrating());
        EXPECT_TRUE(widgetBridge.Persist(snapshot));
        applied = true;
    }));
    EXPECT_TRUE(applied);
    EXPECT_FALSE(widgetBridge.Hydrating());

    // The echo never happened, so main has nothing to pick up.
    EXPECT_FALSE(main.Sync());
    EXPECT_EQ(bus->records[kKey].revision, 1);
}

TEST_F(SyncBridgeTest, OnlyTheDrivingSurfaceCompletesPhases) {
    main.Start("T");
    At(25 * 60'000);

    widget.Tick();
    EXPECT_EQ(widget.CurrentSession().phase, Phase::Work);
    EXPECT_TRUE(widget.GetLedger().Empty());

    main.Tick();
    EXPECT_EQ(main.CurrentSession().phase, Phase::Break);

    widget.Tick();
    EXPECT_EQ(widget.CurrentSession().phase, Phase::Break);
    EXPECT_EQ(widget.GetLedger().Size(), 1u);
}

TEST_F(SyncBridgeTest, HydrateRestoresPersistedState) {
    main.Start("T");
    At(40'000);
    main.Stop();
    main.Start("U");

    MemoryBlobStore store(bus);
    SyncBridge bridge(store, kKey);
    FocusController fresh(clock, SessionDurations{}, &bridge);
    ASSERT_TRUE(fresh.Hydrate());
    EXPECT_EQ(fresh.CurrentSession(), main.CurrentSession());
    EXPECT_EQ(fresh.GetLedger().Entries(), main.GetLedger().Entries());
    // Hydration marks the blob as seen.
    EXPECT_FALSE(fresh.Sync());
}

TEST_F(SyncBridgeTest, HydrateWithoutBlobKeepsDefaults) {
    MemoryBlobStore store(std::make_shared<MemoryBlobBus>());
    SyncBridge bridge(store, kKey);
    FocusController fresh(clock, SessionDurations{}, &bridge);
    EXPECT_FALSE(fresh.Hydrate());
    EXPECT_EQ(fresh.CurrentSession(), Session{});
}

TEST_F(SyncBridgeTest, DeleteTaskCascadesAcrossSurfaces) {
    std::string error;
    MemoryBlobStore raw(bus);
    ASSERT_TRUE(raw.Write(kKey, R"({"tasks": [{"id": "T", "title": "Report"},
                                               {"id": "U", "title": "Mail"}]})",
                          error));
    ASSERT_TRUE(main.Sync());

    main.Start("T");
    At(10'000);
    main.Stop();
    main.Start("U");
    At(20'000);
    main.Stop();
    ASSERT_EQ(main.GetLedger().Size(), 2u);

    EXPECT_TRUE(widget.DeleteTask("T"));
    EXPECT_FALSE(widget.DeleteTask("T"));

    ASSERT_TRUE(main.Sync());
    EXPECT_EQ(main.Board().FindTask("T"), nullptr);
    ASSERT_EQ(main.GetLedger().Size(), 1u);
    EXPECT_EQ(main.GetLedger().Entries()[0].taskId, "U");
}
