#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <random>
#include <stdexcept>

#include "focus_controller.hpp"
#include "sqlite.hpp"
#include "sync_bridge.hpp"

namespace {

const std::string kKey = "calendar-storage";

class SQLiteTest : public ::testing::Test {
  protected:
    void SetUp() override {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("horizon-test-" + std::to_string(rd()) + ".db");
    }

    void TearDown() override {
        std::error_code ec;
        for (const char *suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(path.string() + suffix, ec);
        }
    }

    std::filesystem::path path;
};

} // namespace

TEST_F(SQLiteTest, MissingKeyReadsAsNothing) {
    SQLite db(path.string());
    EXPECT_FALSE(db.Read(kKey).has_value());
    EXPECT_TRUE(db.PollChangedKeys().empty());
}

TEST_F(SQLiteTest, WritesAreSeenByTheOtherConnectionOnly) {
    SQLite a(path.string());
    SQLite b(path.string());
    std::string error;

    ASSERT_TRUE(a.Write(kKey, "{\"v\":1}", error)) << error;
    EXPECT_TRUE(a.PollChangedKeys().empty());

    const auto changed = b.PollChangedKeys();
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0], kKey);
    EXPECT_EQ(b.Read(kKey), std::optional<std::string>("{\"v\":1}"));
    EXPECT_TRUE(b.PollChangedKeys().empty());

    ASSERT_TRUE(b.Write(kKey, "{\"v\":2}", error)) << error;
    EXPECT_TRUE(b.PollChangedKeys().empty());
    ASSERT_EQ(a.PollChangedKeys().size(), 1u);
    EXPECT_EQ(a.Read(kKey), std::optional<std::string>("{\"v\":2}"));
}

TEST_F(SQLiteTest, RepeatedWritesReportOnce) {
    SQLite a(path.string());
    SQLite b(path.string());
    std::string error;

    ASSERT_TRUE(a.Write(kKey, "1", error));
    ASSERT_TRUE(a.Write(kKey, "2", error));
    ASSERT_TRUE(a.Write("other", "x", error));

    auto changed = b.PollChangedKeys();
    std::sort(changed.begin(), changed.end());
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0], kKey);
    EXPECT_EQ(changed[1], "other");
    EXPECT_EQ(b.Read(kKey), std::optional<std::string>("2"));
}

TEST_F(SQLiteTest, ValueSurvivesReopen) {
    std::string error;
    {
        SQLite a(path.string());
        ASSERT_TRUE(a.Write(kKey, "persisted", error));
    }
    SQLite c(path.string());
    EXPECT_EQ(c.Read(kKey), std::optional<std::string>("persisted"));
}

TEST_F(SQLiteTest, UnopenablePathThrows) {
    EXPECT_THROW(SQLite("/nonexistent-horizon-dir/sub/horizon.db"), std::runtime_error);
}

TEST_F(SQLiteTest, TwoSurfacesShareStateThroughTheFile) {
    ManualClock clock{Timestamp{Millis{1'773'140'400'000}}};

    SQLite mainDb(path.string());
    SQLite widgetDb(path.string());
    SyncBridge mainBridge(mainDb, kKey);
    SyncBridge widgetBridge(widgetDb, kKey);
    FocusController main(clock, SessionDurations{}, &mainBridge, true);
    FocusController widget(clock, SessionDurations{}, &widgetBridge, false);

    main.Start("T");
    EXPECT_FALSE(main.Sync());
    ASSERT_TRUE(widget.Sync());
    EXPECT_EQ(widget.CurrentSession(), main.CurrentSession());

    clock.Advance(Millis{9'000});
    widget.Stop();
    ASSERT_TRUE(main.Sync());
    EXPECT_EQ(main.CurrentSession().phase, Phase::Idle);
    ASSERT_EQ(main.GetLedger().Size(), 1u);
    EXPECT_EQ(main.GetLedger().Entries()[0].duration, Millis{9'000});
}
