#pragma once

#include "tablepod/core/api/ServiceConfig.h"
#include "tablepod/core/broadcast/IBroadcastAdapter.h"
#include "tablepod/core/broadcast/SessionEvents.h"
#include "tablepod/core/model/Session.h"
#include "tablepod/core/persist/SessionStore.h"
#include "tablepod/core/session/CommandResult.h"
#include "tablepod/core/session/RoundController.h"
#include "tablepod/core/session/SessionRegistry.h"
#include "tablepod/core/util/SecureRandom.h"
#include "tablepod/core/util/Timestamp.h"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tablepod::core::api {

using session::CommandResult;
using session::CommandStatus;

struct JoinResult {
    CommandStatus status = CommandStatus::Success;
    std::string message;
    model::Participant participant;

    bool ok() const { return status == CommandStatus::Success; }
};

struct StandingRow {
    std::string id;
    std::string name;
    int games = 0;
    int wins = 0;
    int draws = 0;
    int losses = 0;
    int byes = 0;
    int points = 0;
    double winPercent = 0.0;
    bool active = true;
};

// Inbound surface of the engine. Every command locks one session, applies
// the change in memory, releases the lock, then saves and publishes on a
// snapshot. Save and publish failures are logged and never undo a command.
class SessionService {
public:
    SessionService();
    explicit SessionService(const ServiceConfig& config);
    ~SessionService();

    SessionService(const SessionService&) = delete;
    SessionService& operator=(const SessionService&) = delete;

    bool loadConfig(const std::string& path);
    bool saveConfig(const std::string& path) const;
    void setConfig(const ServiceConfig& config);
    ServiceConfig getConfigSnapshot() const;

    // Replaces the store built from the storage config.
    void setSessionStore(std::shared_ptr<persist::ISessionStore> store);
    void setBroadcastAdapter(std::shared_ptr<broadcast::IBroadcastAdapter> adapter);

    // code_length and ttl fall back to the configured values when not positive.
    CommandResult createSession(const std::string& host_id,
                                int code_length = 0,
                                std::chrono::minutes ttl = std::chrono::minutes(0),
                                const std::string& event_name = "");
    JoinResult join(const std::string& code,
                    const std::string& participant_id,
                    const std::string& name = "",
                    const std::string& role = "");

    // Internal consistency failures surface as std::logic_error.
    CommandResult generateRound(const std::string& code, session::RoundCommand command);
    CommandResult startRound(const std::string& code);
    CommandResult resetRound(const std::string& code);
    session::OutcomeReport reportOutcome(const std::string& code, const session::OutcomeRequest& request);
    CommandResult createCustomGroup(const std::string& code,
                                    const std::vector<std::string>& participant_ids,
                                    bool auto_fill);
    CommandResult deleteCustomGroup(const std::string& code, const std::string& group_id);
    CommandResult moveParticipant(const std::string& code,
                                  int source_table,
                                  int target_table,
                                  int round_number,
                                  const std::string& participant_id);
    CommandResult setTableResult(const std::string& code,
                                 int table_number,
                                 model::ResultKind result,
                                 const std::string& winner_id = "");
    CommandResult endRound(const std::string& code);
    CommandResult endGame(const std::string& code);
    CommandResult updateSettings(const std::string& code,
                                 const std::string& host_id,
                                 const model::Settings& settings,
                                 const std::string& event_name = "");

    std::optional<model::Session> getSession(const std::string& code);
    std::vector<StandingRow> getStandings(const std::string& code);
    bool exportResults(const std::string& code, const std::string& directory, std::string* error);

    bool invalidateSession(const std::string& code);
    size_t sweepExpired(util::TimePoint now = util::Clock::now());
    void startSweeper();
    void stopSweeper();
    // Loads every stored session into the registry. Returns the number loaded.
    int restoreSessions(std::string* error);

    broadcast::SessionEvents& events() { return events_; }
    size_t sessionCount() const { return registry_.size(); }
    std::string getLastLogLines(int n) const;

private:
    using SessionCommand = std::function<CommandResult(session::RoundController&, model::Session&)>;

    CommandResult RunCommand(const std::string& code,
                             const char* name,
                             const SessionCommand& command,
                             std::optional<broadcast::SessionEventType> event);
    session::RoundController MakeController() const;
    CommandResult CheckAvailable(const session::SessionLease& lease, const std::string& code) const;

    void Persist(const model::Session& snapshot);
    void Publish(broadcast::SessionEventType type, const model::Session& snapshot, nlohmann::json payload);
    void OnSwept(std::vector<model::Session> swept);
    void ApplyConfig(const ServiceConfig& config);
    void Log(const std::string& line) const;
    void AppendLogLine(const std::string& line) const;

    mutable util::SecureRandom random_;
    session::SessionRegistry registry_;
    broadcast::SessionEvents events_;

    mutable std::mutex config_mutex_;
    ServiceConfig config_{};
    std::shared_ptr<persist::ISessionStore> store_;
    std::shared_ptr<broadcast::IBroadcastAdapter> adapter_;

    mutable std::mutex log_mutex_;
    mutable std::deque<std::string> log_lines_{};
    size_t max_log_lines_ = 2000;
    bool mirror_stderr_ = true;
};

}  // namespace tablepod::core::api
