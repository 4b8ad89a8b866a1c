#include "tablepod/core/api/SessionService.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <stdexcept>

using tablepod::core::api::CommandStatus;
using tablepod::core::api::ServiceConfig;
using tablepod::core::api::SessionService;
using tablepod::core::broadcast::SessionEvent;
using tablepod::core::broadcast::SessionEventType;
using tablepod::core::model::ResultKind;
using tablepod::core::model::Session;
using tablepod::core::persist::ISessionStore;
using tablepod::core::session::OutcomeRequest;
using tablepod::core::session::OutcomeType;
using tablepod::core::session::ReportOutcomeStatus;
using tablepod::core::session::RoundCommand;
using tablepod::core::util::Clock;

namespace {

class MemorySessionStore : public ISessionStore {
public:
    bool Save(const Session& session, std::string* error) override {
        if (fail_saves) {
            if (error) {
                *error = "disk full";
            }
            return false;
        }
        saved[session.code] = session;
        ++save_count;
        return true;
    }

    std::vector<Session> LoadAll(std::string*) override {
        std::vector<Session> sessions;
        for (const auto& [code, session] : saved) {
            sessions.push_back(session);
        }
        return sessions;
    }

    std::map<std::string, Session> saved;
    int save_count = 0;
    bool fail_saves = false;
};

ServiceConfig QuietConfig() {
    ServiceConfig config;
    config.logging.mirror_stderr = false;
    return config;
}

class SessionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemorySessionStore>();
        service_.setSessionStore(store_);
        service_.events().Subscribe([this](const SessionEvent& event) { events_.push_back(event); });
    }

    std::string CreateWithPlayers(int count) {
        const auto created = service_.createSession("host", 0, std::chrono::minutes(0), "Friday");
        EXPECT_TRUE(created.ok()) << created.message;
        for (int i = 1; i <= count; ++i) {
            EXPECT_TRUE(service_.join(created.code, "p" + std::to_string(i), "Player " + std::to_string(i)).ok());
        }
        return created.code;
    }

    int CountEvents(SessionEventType type) const {
        int count = 0;
        for (const auto& event : events_) {
            if (event.type == type) {
                ++count;
            }
        }
        return count;
    }

    SessionService service_{QuietConfig()};
    std::shared_ptr<MemorySessionStore> store_;
    std::vector<SessionEvent> events_;
};

}  // namespace

TEST_F(SessionServiceTest, CreateUsesConfiguredDefaults) {
    const auto created = service_.createSession("host");
    ASSERT_TRUE(created.ok());
    EXPECT_EQ(created.code.size(), 6u);

    const auto session = service_.getSession(created.code);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->host_id, "host");
    const auto ttl = std::chrono::duration_cast<std::chrono::minutes>(session->expires_at - session->created_at);
    EXPECT_EQ(ttl.count(), 7 * 24 * 60);
    EXPECT_EQ(store_->saved.count(created.code), 1u);

    EXPECT_EQ(service_.createSession("").status, CommandStatus::InvalidArgument);
    EXPECT_EQ(service_.createSession("host", 2).status, CommandStatus::InvalidArgument);
}

TEST_F(SessionServiceTest, JoinRules) {
    const auto code = CreateWithPlayers(1);

    EXPECT_EQ(service_.join("", "p2").status, CommandStatus::InvalidArgument);
    EXPECT_EQ(service_.join(code, "").status, CommandStatus::InvalidArgument);
    EXPECT_EQ(service_.join("ZZZZZZ", "p2").status, CommandStatus::SessionNotFound);
    EXPECT_EQ(service_.join(code, "p1").status, CommandStatus::DuplicateParticipant);

    const auto joined = service_.join(code, "p2");
    ASSERT_TRUE(joined.ok());
    EXPECT_EQ(joined.participant.name, "p2");
    EXPECT_EQ(CountEvents(SessionEventType::ParticipantJoined), 2);
    EXPECT_TRUE(events_.back().payload.contains("session"));
}

TEST_F(SessionServiceTest, JoinClosesAfterStartWhenConfigured) {
    const auto code = CreateWithPlayers(6);
    auto settings = service_.getSession(code)->settings;
    settings.allow_join_after_start = false;

    EXPECT_EQ(service_.updateSettings(code, "intruder", settings).status, CommandStatus::NotAuthorized);
    ASSERT_TRUE(service_.updateSettings(code, "host", settings).ok());
    EXPECT_EQ(CountEvents(SessionEventType::SettingsChanged), 1);

    ASSERT_TRUE(service_.join(code, "early").ok());
    ASSERT_TRUE(service_.generateRound(code, RoundCommand::First).ok());
    EXPECT_EQ(service_.join(code, "late").status, CommandStatus::JoinClosed);

    ASSERT_TRUE(service_.endGame(code).ok());
    EXPECT_EQ(service_.join(code, "later").status, CommandStatus::SessionEnded);
}

TEST_F(SessionServiceTest, UpdateSettingsValidatesValues) {
    const auto code = CreateWithPlayers(0);
    auto settings = service_.getSession(code)->settings;
    settings.max_table_size = 5;
    EXPECT_EQ(service_.updateSettings(code, "host", settings).status, CommandStatus::InvalidArgument);
    settings.max_table_size = 3;
    EXPECT_EQ(service_.updateSettings("", "host", settings).status, CommandStatus::InvalidArgument);
    EXPECT_EQ(service_.updateSettings(code, "", settings).status, CommandStatus::InvalidArgument);
    ASSERT_TRUE(service_.updateSettings(code, "host", settings, "Saturday").ok());
    EXPECT_EQ(service_.getSession(code)->event_name, "Saturday");
}

TEST_F(SessionServiceTest, FullRoundLifecyclePublishesEvents) {
    const auto code = CreateWithPlayers(8);

    const auto first = service_.generateRound(code, RoundCommand::First);
    ASSERT_TRUE(first.ok()) << first.message;
    EXPECT_EQ(first.code, code);
    EXPECT_EQ(first.tables.size(), 2u);
    EXPECT_EQ(CountEvents(SessionEventType::RoundGenerated), 1);
    EXPECT_EQ(events_.back().payload.at("round"), 1);

    ASSERT_TRUE(service_.startRound(code).ok());
    EXPECT_EQ(CountEvents(SessionEventType::RoundStarted), 1);

    const auto& table = first.tables[0];
    OutcomeRequest request;
    request.participant_id = table.seats[0].id;
    request.outcome = OutcomeType::Win;
    ASSERT_TRUE(service_.reportOutcome(code, request).ok());
    EXPECT_EQ(CountEvents(SessionEventType::GameEnded), 1);

    ASSERT_TRUE(service_.setTableResult(code, first.tables[1].number, ResultKind::Draw).ok());
    EXPECT_EQ(CountEvents(SessionEventType::GameEnded), 2);

    const auto next = service_.generateRound(code, RoundCommand::Next);
    ASSERT_TRUE(next.ok()) << next.message;
    EXPECT_EQ(next.round_number, 2);
    EXPECT_TRUE(next.tables[0].Contains(table.seats[0].id));

    const auto standings = service_.getStandings(code);
    ASSERT_EQ(standings.size(), 8u);
    EXPECT_EQ(standings.front().id, table.seats[0].id);
    EXPECT_EQ(standings.front().wins, 1);

    EXPECT_GT(store_->save_count, 10);
}

TEST_F(SessionServiceTest, RejectedCommandsDoNotPublish) {
    const auto code = CreateWithPlayers(3);
    const auto before = events_.size();
    const int saves = store_->save_count;

    const auto result = service_.generateRound(code, RoundCommand::First);

    EXPECT_EQ(result.status, CommandStatus::InsufficientParticipants);
    EXPECT_EQ(events_.size(), before);
    EXPECT_EQ(store_->save_count, saves);
    EXPECT_NE(service_.getLastLogLines(5).find("rejected"), std::string::npos);
}

TEST_F(SessionServiceTest, SaveFailureDoesNotUndoCommand) {
    const auto code = CreateWithPlayers(0);
    store_->fail_saves = true;

    ASSERT_TRUE(service_.join(code, "p1").ok());
    EXPECT_EQ(service_.getSession(code)->participants.count("p1"), 1u);
    EXPECT_NE(service_.getLastLogLines(10).find("disk full"), std::string::npos);
}

TEST_F(SessionServiceTest, ReportOutcomeOnUnknownRoom) {
    OutcomeRequest request;
    request.participant_id = "p1";
    EXPECT_EQ(service_.reportOutcome("NOPE", request).status, ReportOutcomeStatus::RoomNotFound);
    EXPECT_EQ(service_.reportOutcome("", request).status, ReportOutcomeStatus::Invalid);
}

TEST_F(SessionServiceTest, DropOutPublishesEvent) {
    const auto code = CreateWithPlayers(6);
    OutcomeRequest request;
    request.participant_id = "p6";
    request.outcome = OutcomeType::DropOut;

    ASSERT_TRUE(service_.reportOutcome(code, request).ok());
    EXPECT_EQ(CountEvents(SessionEventType::ParticipantDropped), 1);
    EXPECT_EQ(service_.getSession(code)->participants.size(), 5u);
}

TEST_F(SessionServiceTest, ExpiredSessionsAreSweptAndRestored) {
    const auto created = service_.createSession("host", 6, std::chrono::minutes(1));
    ASSERT_TRUE(created.ok());

    EXPECT_EQ(service_.sweepExpired(Clock::now() + std::chrono::minutes(2)), 1u);
    EXPECT_EQ(service_.sessionCount(), 0u);
    EXPECT_EQ(CountEvents(SessionEventType::SessionExpired), 1);
    EXPECT_EQ(service_.startRound(created.code).status, CommandStatus::SessionNotFound);
    ASSERT_EQ(store_->saved.count(created.code), 1u);
    EXPECT_TRUE(store_->saved.at(created.code).ended);

    std::string error;
    EXPECT_EQ(service_.restoreSessions(&error), 1);
    const auto restored = service_.getSession(created.code);
    ASSERT_TRUE(restored.has_value());
    EXPECT_TRUE(restored->ended);
    EXPECT_EQ(service_.restoreSessions(&error), 0);
}

TEST_F(SessionServiceTest, InvalidateSession) {
    const auto code = CreateWithPlayers(0);
    EXPECT_TRUE(service_.invalidateSession(code));
    EXPECT_FALSE(service_.invalidateSession(code));
    EXPECT_FALSE(service_.getSession(code).has_value());
    EXPECT_EQ(CountEvents(SessionEventType::SessionExpired), 1);
}

TEST_F(SessionServiceTest, ExportWritesFiles) {
    const auto code = CreateWithPlayers(6);
    const auto directory = std::filesystem::temp_directory_path() / "tablepod_service_export";
    std::filesystem::remove_all(directory);
    std::string error;

    ASSERT_TRUE(service_.exportResults(code, directory.string(), &error)) << error;
    EXPECT_TRUE(std::filesystem::exists(directory / (code + "_standings.csv")));
    EXPECT_TRUE(std::filesystem::exists(directory / (code + "_summary.json")));
    EXPECT_FALSE(service_.exportResults("NOPE", directory.string(), &error));

    std::filesystem::remove_all(directory);
}
