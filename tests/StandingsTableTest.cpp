#include "tablepod/core/export/ExportWriter.h"
#include "tablepod/core/stats/StandingsTable.h"

#include "TestSupport.h"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using tablepod::core::model::Settings;
using tablepod::core::model::kByeTableNumber;
using tablepod::core::stats::StandingsTable;
using tablepod::test::MakeSession;
using tablepod::test::MakeTable;

TEST(StandingsTableTest, ScoresWinsDrawsAndByes) {
    Settings settings;
    StandingsTable table(settings);

    auto won = MakeTable(1, {"a", "b", "c", "d"});
    won.SetWinner("a");
    auto drawn = MakeTable(2, {"e", "f", "g"});
    drawn.SetDraw();
    const auto open = MakeTable(3, {"h", "i", "j"});
    const auto bye = MakeTable(kByeTableNumber, {"k"});
    table.RecordRound({won, drawn, open, bye});

    EXPECT_EQ(table.Find("a")->points, 3);
    EXPECT_EQ(table.Find("a")->wins, 1);
    EXPECT_EQ(table.Find("b")->losses, 1);
    EXPECT_EQ(table.Find("b")->points, 0);
    EXPECT_EQ(table.Find("e")->draws, 1);
    EXPECT_EQ(table.Find("e")->points, 1);
    EXPECT_EQ(table.Find("k")->byes, 1);
    EXPECT_EQ(table.Find("k")->points, 1);
    EXPECT_EQ(table.Find("h")->games, 0);
    EXPECT_EQ(table.games_played(), 2);
    EXPECT_DOUBLE_EQ(table.Find("a")->win_percent(), 100.0);

    const auto ranked = table.Ranked();
    EXPECT_EQ(ranked.front().id, "a");
}

TEST(StandingsTableTest, SessionStandingsMarkDroppedParticipants) {
    auto session = MakeSession(4);
    auto played = MakeTable(1, {"p1", "p2", "p3", "p4", "p5"});
    played.SetWinner("p5");
    session.archived_rounds.push_back({played});

    const auto standings = StandingsTable::FromSession(session);

    ASSERT_NE(standings.Find("p5"), nullptr);
    EXPECT_FALSE(standings.Find("p5")->active);
    EXPECT_TRUE(standings.Find("p1")->active);
    EXPECT_EQ(standings.Ranked().front().id, "p5");
}

TEST(ExportWriterTest, WritesStandingsAndSummary) {
    auto session = MakeSession(4, "EXPORT");
    session.event_name = "League, week 3";
    auto played = MakeTable(1, {"p1", "p2", "p3", "p4"});
    played.SetWinner("p2");
    session.archived_rounds.push_back({played});
    const auto ranked = StandingsTable::FromSession(session).Ranked();

    const auto directory = std::filesystem::temp_directory_path() / "tablepod_export_test";
    std::filesystem::remove_all(directory);
    std::filesystem::create_directories(directory);
    const auto csv_path = (directory / "standings.csv").string();
    const auto json_path = (directory / "summary.json").string();
    std::string error;

    ASSERT_TRUE(tablepod::core::exporter::WriteStandingsCsv(csv_path, ranked, &error)) << error;
    ASSERT_TRUE(tablepod::core::exporter::WriteSummaryJson(json_path, session, &error)) << error;

    std::ifstream csv(csv_path);
    std::string header;
    std::string first;
    std::getline(csv, header);
    std::getline(csv, first);
    EXPECT_NE(first.find("p2"), std::string::npos);

    std::ifstream json_input(json_path);
    const auto summary = nlohmann::json::parse(json_input);
    EXPECT_EQ(summary.at("code"), "EXPORT");
    EXPECT_EQ(summary.at("event"), "League, week 3");
    EXPECT_EQ(summary.at("rounds_played"), 1);
    EXPECT_EQ(summary.at("top10").size(), 4u);

    std::filesystem::remove_all(directory);
}
