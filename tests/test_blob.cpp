#include <gtest/gtest.h>

#include "blob.hpp"

namespace {

const char *kBlob = R"({
  "tasks": [
    {"id": "t1", "title": "Write report", "projectId": "p1", "completed": false,
     "priority": "high", "dueDate": "2026-03-12"},
    {"id": "t2", "title": "Read", "projectId": null, "completed": true}
  ],
  "projects": [
    {"id": "p1", "name": "Work", "parentId": null, "color": "#ff0000"}
  ],
  "timeEntries": [
    {"id": "e1", "taskId": "t1", "startedAt": "2026-03-10T09:00:00.000Z",
     "endedAt": "2026-03-10T09:25:00.000Z", "duration": 1500000}
  ],
  "session": {"targetId": "t1", "phase": "work", "anchor": "2026-03-10T10:00:00.000Z",
              "sessionsCompletedToday": 2, "paused": false, "pausedElapsed": 0},
  "calendarView": "week",
  "events": [{"id": "ev1"}]
})";

} // namespace

TEST(BlobCodecTest, DecodesAllSections) {
    BlobCodec codec;
    const auto snap = codec.Decode(kBlob);
    ASSERT_TRUE(snap.has_value());

    EXPECT_EQ(snap->board.Tasks().size(), 2u);
    EXPECT_EQ(snap->board.Projects().size(), 1u);
    ASSERT_EQ(snap->ledger.Size(), 1u);
    EXPECT_EQ(snap->ledger.Entries()[0].duration, std::chrono::minutes(25));

    const Session &s = snap->session;
    EXPECT_EQ(s.phase, Phase::Work);
    EXPECT_EQ(s.targetId, std::optional<std::string>("t1"));
    EXPECT_EQ(s.sessionsCompletedToday, 2);
    ASSERT_TRUE(s.anchor.has_value());
    EXPECT_EQ(ToIso8601(*s.anchor), "2026-03-10T10:00:00.000Z");
}

TEST(BlobCodecTest, PreservesFieldsItDoesNotModel) {
    BlobCodec codec;
    auto snap = codec.Decode(kBlob);
    ASSERT_TRUE(snap.has_value());
    ASSERT_TRUE(snap->board.SetTaskCompleted("t1", true));

    const nlohmann::json out = codec.ToJson(*snap);
    EXPECT_EQ(out["calendarView"], "week");
    EXPECT_EQ(out["events"][0]["id"], "ev1");
    EXPECT_EQ(out["tasks"][0]["priority"], "high");
    EXPECT_EQ(out["tasks"][0]["dueDate"], "2026-03-12");
    EXPECT_EQ(out["tasks"][0]["completed"], true);
    EXPECT_EQ(out["projects"][0]["color"], "#ff0000");
}

TEST(BlobCodecTest, EncodeDecodeKeepsState) {
    BlobCodec codec;
    const auto first = codec.Decode(kBlob);
    ASSERT_TRUE(first.has_value());
    const auto second = codec.Decode(codec.Encode(*first));
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(second->session, first->session);
    EXPECT_EQ(second->ledger.Entries(), first->ledger.Entries());
    EXPECT_EQ(second->extra, first->extra);
}

TEST(BlobCodecTest, MalformedTextIsRejected) {
    BlobCodec codec;
    EXPECT_FALSE(codec.Decode("").has_value());
    EXPECT_FALSE(codec.Decode("{\"tasks\": [").has_value());
    EXPECT_FALSE(codec.Decode("[1, 2, 3]").has_value());
    EXPECT_FALSE(codec.Decode("\"calendar\"").has_value());
}

TEST(BlobCodecTest, EmptyObjectDecodesToDefaults) {
    BlobCodec codec;
    const auto snap = codec.Decode("{}");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->session, Session{});
    EXPECT_TRUE(snap->ledger.Empty());
    EXPECT_TRUE(snap->board.Tasks().empty());
}

TEST(BlobCodecTest, BrokenMembersDegradeInsteadOfFailing) {
    BlobCodec codec;
    const auto snap = codec.Decode(R"({
      "tasks": "oops",
      "timeEntries": [
        42,
        {"id": "bad", "taskId": "t1", "startedAt": "never", "endedAt": "2026-03-10T09:25:00Z"},
        {"taskId": "t1", "startedAt": "2026-03-10T09:00:00Z", "endedAt": "2026-03-10T09:00:06Z"}
      ],
      "session": {"phase": "sleeping", "anchor": "2026-03-10T10:00:00Z"}
    })");
    ASSERT_TRUE(snap.has_value());
    EXPECT_TRUE(snap->board.Tasks().empty());
    ASSERT_EQ(snap->ledger.Size(), 1u);
    EXPECT_EQ(snap->ledger.Entries()[0].duration, Millis{6000});
    EXPECT_FALSE(snap->ledger.Entries()[0].id.empty());
    EXPECT_EQ(snap->session.phase, Phase::Idle);
    EXPECT_FALSE(snap->session.anchor.has_value());
}

TEST(BlobCodecTest, RepairsAnchorInvariant) {
    BlobCodec codec;

    auto running = codec.Decode(R"({"session": {"phase": "work", "targetId": "t1",
                                                "anchor": null, "paused": false}})");
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->session.phase, Phase::Idle);

    auto paused = codec.Decode(R"({"session": {"phase": "break", "paused": true,
                                               "anchor": "2026-03-10T10:00:00Z",
                                               "pausedElapsed": 42000}})");
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused->session.phase, Phase::Break);
    EXPECT_TRUE(paused->session.paused);
    EXPECT_FALSE(paused->session.anchor.has_value());
    EXPECT_EQ(paused->session.pausedElapsed, Millis{42000});
}

TEST(BlobCodecTest, EntryDurationFollowsTimestamps) {
    BlobCodec codec;
    const auto snap = codec.Decode(R"({"timeEntries": [
      {"id": "e1", "taskId": "T", "startedAt": "2026-03-10T12:00:00.000Z",
       "endedAt": "2026-03-10T12:00:10.000Z", "duration": 999999999},
      {"id": "e2", "taskId": "T", "startedAt": "2026-03-10T13:00:00.000Z",
       "endedAt": "2026-03-10T13:00:10.000Z", "duration": 9223372036854775807},
      {"id": "e3", "taskId": "T", "startedAt": "2026-03-10T14:00:10.000Z",
       "endedAt": "2026-03-10T14:00:00.000Z", "duration": 10000}
    ]})");
    ASSERT_TRUE(snap.has_value());
    ASSERT_EQ(snap->ledger.Size(), 2u);
    for (const auto &e : snap->ledger.Entries()) {
        EXPECT_EQ(e.endedAt - e.startedAt, e.duration);
    }
    EXPECT_EQ(snap->ledger.TotalForTask("T"), Millis{20'000});
}

TEST(BlobCodecTest, OutOfRangeNumbersFallBack) {
    BlobCodec codec;
    const auto paused = codec.Decode(R"({"session": {"phase": "work", "paused": true,
                                                     "pausedElapsed": 1e300,
                                                     "sessionsCompletedToday": 1e300}})");
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused->session.sessionsCompletedToday, 0);
    EXPECT_EQ(paused->session.pausedElapsed, Millis{0});

    const auto big = codec.Decode(R"({"session": {"phase": "break", "paused": true,
                                                  "pausedElapsed": 5000000000,
                                                  "sessionsCompletedToday": 5000000000}})");
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ(big->session.sessionsCompletedToday, 0);
    EXPECT_EQ(big->session.pausedElapsed, Millis{5'000'000'000});

    JsonParse parser;
    const nlohmann::json j = {{"neg", -1e300}, {"huge", 1e20}, {"u", 18446744073709551615ULL},
                              {"ok", 42.9}};
    EXPECT_EQ(parser.GetInt(j, "neg", 7), 7);
    EXPECT_EQ(parser.GetInt64(j, "huge", 7), 7);
    EXPECT_EQ(parser.GetInt64(j, "u", 7), 7);
    EXPECT_EQ(parser.GetInt(j, "ok", 7), 42);
}

TEST(BlobCodecTest, EntryWithoutIdGetsStableId) {
    BlobCodec codec;
    const char *text = R"({"timeEntries": [
      {"taskId": "t1", "startedAt": "2026-03-10T09:00:00Z", "endedAt": "2026-03-10T09:00:06Z"}
    ]})";
    const auto first = codec.Decode(text);
    const auto second = codec.Decode(text);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(first->ledger.Size(), 1u);
    EXPECT_EQ(first->ledger.Entries()[0].id, "t1@1773133200000");
    EXPECT_EQ(first->ledger.Entries()[0].id, second->ledger.Entries()[0].id);
}

TEST(BlobCodecTest, SessionJsonShape) {
    BlobCodec codec;
    Session s;
    s.phase = Phase::Work;
    s.anchor = Timestamp{Millis{1'773'140'400'000}};
    const nlohmann::json j = codec.SessionToJson(s);
    EXPECT_TRUE(j["targetId"].is_null());
    EXPECT_EQ(j["phase"], "work");
    EXPECT_EQ(j["anchor"], "2026-03-10T11:00:00.000Z");
    EXPECT_EQ(j["paused"], false);
    EXPECT_EQ(j["pausedElapsed"], 0);
}
