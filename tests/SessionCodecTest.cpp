#include "tablepod/core/persist/SessionCodec.h"
#include "tablepod/core/persist/SessionStore.h"

#include "TestSupport.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using tablepod::core::model::ResultKind;
using tablepod::core::model::Session;
using tablepod::core::persist::JsonFileSessionStore;
using tablepod::core::persist::ParseSession;
using tablepod::core::persist::SessionToJson;
using tablepod::core::util::Clock;
using tablepod::core::util::FormatUtcTimestamp;
using tablepod::core::util::ParseUtcTimestamp;
using tablepod::core::util::TimePoint;
using tablepod::test::MakeSession;
using tablepod::test::MakeTable;

namespace {

Session PlayedSession() {
    auto session = MakeSession(4, "CODEC1");
    session.event_name = "Friday Commander";
    session.settings.use_points = true;
    session.settings.max_rounds = 5;
    session.current_round = 2;
    session.started = true;
    session.participants["p1"].custom_group_id = "abcdef0123456789";
    session.participants["p1"].auto_fill = true;

    auto archived = MakeTable(1, {"p1", "p2", "p3", "p4"});
    archived.SetWinner("p3");
    archived.completed_at = session.created_at;
    archived.statistics = {{"turns", 11}};
    session.archived_rounds.push_back({archived});

    auto current = MakeTable(1, {"p4", "p3", "p2", "p1"});
    current.round_started = true;
    current.started_at = session.created_at;
    session.tables = tablepod::core::model::Round{current};
    return session;
}

}  // namespace

TEST(SessionCodecTest, TimestampsKeepMilliseconds) {
    const TimePoint at = Clock::from_time_t(1700000000) + std::chrono::milliseconds(437);
    EXPECT_EQ(FormatUtcTimestamp(at), "2023-11-14T22:13:20.437Z");

    TimePoint parsed;
    ASSERT_TRUE(ParseUtcTimestamp("2023-11-14T22:13:20.437Z", parsed));
    EXPECT_EQ(parsed, at);
    ASSERT_TRUE(ParseUtcTimestamp("2023-11-14T22:13:20Z", parsed));
    EXPECT_EQ(parsed, Clock::from_time_t(1700000000));
    EXPECT_FALSE(ParseUtcTimestamp("2023-11-14T22:13:20.Z", parsed));

    auto session = MakeSession(4, "MILLIS");
    session.created_at = at;
    session.expires_at = at + std::chrono::hours(24);
    session.participants["p1"].joined_at = at;
    Session decoded;
    std::string error;
    ASSERT_TRUE(ParseSession(SessionToJson(session).dump(), decoded, &error)) << error;
    EXPECT_EQ(decoded.created_at, at);
    EXPECT_EQ(decoded.expires_at, session.expires_at);
    EXPECT_EQ(decoded.participants.at("p1").joined_at, at);
}

TEST(SessionCodecTest, SessionSurvivesSerialisation) {
    const auto original = PlayedSession();
    Session decoded;
    std::string error;

    ASSERT_TRUE(ParseSession(SessionToJson(original).dump(), decoded, &error)) << error;

    EXPECT_EQ(decoded.code, original.code);
    EXPECT_EQ(decoded.event_name, "Friday Commander");
    EXPECT_EQ(FormatUtcTimestamp(decoded.expires_at), FormatUtcTimestamp(original.expires_at));
    EXPECT_TRUE(decoded.settings.use_points);
    EXPECT_EQ(decoded.settings.max_rounds, 5);
    EXPECT_EQ(decoded.current_round, 2);
    EXPECT_EQ(decoded.participants.size(), 4u);
    EXPECT_EQ(decoded.participants.at("p1").custom_group_id, "abcdef0123456789");
    EXPECT_TRUE(decoded.participants.at("p1").auto_fill);

    ASSERT_EQ(decoded.archived_rounds.size(), 1u);
    const auto& archived = decoded.archived_rounds[0][0];
    EXPECT_EQ(archived.result, ResultKind::Win);
    EXPECT_EQ(archived.winner_id, "p3");
    EXPECT_EQ(archived.statistics.value("turns", 0), 11);
    ASSERT_TRUE(archived.completed_at.has_value());

    ASSERT_TRUE(decoded.tables.has_value());
    const auto& current = (*decoded.tables)[0];
    EXPECT_TRUE(current.round_started);
    EXPECT_FALSE(current.completed_at.has_value());
    EXPECT_EQ(current.seats[0].id, "p4");
}

TEST(SessionCodecTest, RejectsMalformedDocuments) {
    Session decoded;
    std::string error;
    EXPECT_FALSE(ParseSession("{not json", decoded, &error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(ParseSession(R"({"version": 1, "code": "X", "created_at": "yesterday"})", decoded, &error));
    EXPECT_FALSE(error.empty());
}

TEST(SessionCodecTest, FileStoreSavesAndLoads) {
    const auto directory = std::filesystem::temp_directory_path() / "tablepod_store_test";
    std::filesystem::remove_all(directory);
    JsonFileSessionStore store(directory.string(), [](const std::string&) {});

    std::string error;
    ASSERT_TRUE(store.Save(PlayedSession(), &error)) << error;
    ASSERT_TRUE(std::filesystem::exists(store.PathFor("CODEC1")));
    {
        std::ofstream broken(directory / "BROKEN.json");
        broken << "{";
    }

    error.clear();
    const auto sessions = store.LoadAll(&error);
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].code, "CODEC1");
    EXPECT_FALSE(error.empty());

    std::filesystem::remove_all(directory);
}
