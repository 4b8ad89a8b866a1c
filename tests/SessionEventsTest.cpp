#include "tablepod/core/broadcast/EventFeedWriter.h"
#include "tablepod/core/broadcast/SessionEvents.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using tablepod::core::broadcast::EventFeedWriter;
using tablepod::core::broadcast::SessionEvent;
using tablepod::core::broadcast::SessionEvents;
using tablepod::core::broadcast::SessionEventType;

TEST(SessionEventsTest, ThrowingListenerDoesNotStopOthers) {
    std::vector<std::string> logged;
    SessionEvents events([&logged](const std::string& line) { logged.push_back(line); });
    int delivered = 0;
    events.Subscribe([](const SessionEvent&) { throw std::runtime_error("listener down"); });
    const int id = events.Subscribe([&delivered](const SessionEvent&) { ++delivered; });

    SessionEvent event;
    event.type = SessionEventType::RoundGenerated;
    event.code = "ROOM";
    events.Emit(event);

    EXPECT_EQ(delivered, 1);
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_NE(logged[0].find("listener down"), std::string::npos);

    EXPECT_TRUE(events.Unsubscribe(id));
    EXPECT_FALSE(events.Unsubscribe(id));
    EXPECT_EQ(events.listener_count(), 1u);
}

TEST(EventFeedWriterTest, AppendsOneLinePerEvent) {
    const auto path = std::filesystem::temp_directory_path() / "tablepod_feed_test" / "events.jsonl";
    std::filesystem::remove_all(path.parent_path());
    EventFeedWriter writer;
    ASSERT_TRUE(writer.Configure(path.string()));

    SessionEvent event;
    event.type = SessionEventType::ParticipantJoined;
    event.code = "ROOM";
    event.payload = {{"participant", {{"id", "p1"}}}, {"session", {{"code", "ROOM"}}}};
    ASSERT_TRUE(writer.Publish(event));
    event.type = SessionEventType::RoundGenerated;
    ASSERT_TRUE(writer.Publish(event));

    std::ifstream input(path);
    std::string line;
    std::vector<nlohmann::json> lines;
    while (std::getline(input, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].at("seq"), 1);
    EXPECT_EQ(lines[0].at("type"), "participant_joined");
    EXPECT_EQ(lines[0].at("payload").at("participant").at("id"), "p1");
    EXPECT_FALSE(lines[0].at("payload").contains("session"));
    EXPECT_EQ(lines[1].at("seq"), 2);
    EXPECT_EQ(lines[1].at("type"), "round_generated");

    std::filesystem::remove_all(path.parent_path());
}

TEST(EventFeedWriterTest, UnconfiguredWriterRejectsEvents) {
    EventFeedWriter writer;
    EXPECT_FALSE(writer.Configure(""));
    EXPECT_FALSE(writer.Publish(SessionEvent{}));
}
