#include "tablepod/core/api/SessionService.h"

#include "tablepod/core/broadcast/EventFeedWriter.h"
#include "tablepod/core/export/ExportWriter.h"
#include "tablepod/core/persist/SessionCodec.h"
#include "tablepod/core/stats/StandingsTable.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace tablepod::core::api {

namespace {

CommandResult Unavailable(const std::string& code, const std::string& message) {
    auto result = CommandResult::Error(CommandStatus::SessionNotFound, message);
    result.code = code;
    return result;
}

nlohmann::json TablesPayload(const model::Session& snapshot) {
    nlohmann::json payload;
    payload["round"] = snapshot.current_round;
    payload["tables"] = snapshot.tables.has_value() ? persist::RoundToJson(*snapshot.tables)
                                                    : nlohmann::json::array();
    return payload;
}

}  // namespace

SessionService::SessionService() : SessionService(ServiceConfig{}) {}

SessionService::SessionService(const ServiceConfig& config)
    : registry_(random_, [this](const std::string& line) { Log(line); }),
      events_([this](const std::string& line) { Log(line); }) {
    ApplyConfig(config);
}

SessionService::~SessionService() {
    stopSweeper();
}

bool SessionService::loadConfig(const std::string& path) {
    ServiceConfig config;
    std::string error;
    if (!ServiceConfig::LoadFromFile(path, config, &error)) {
        Log("[tablepod] " + error);
        return false;
    }
    setConfig(config);
    return true;
}

bool SessionService::saveConfig(const std::string& path) const {
    std::string error;
    if (!ServiceConfig::SaveToFile(path, getConfigSnapshot(), &error)) {
        std::cerr << "[tablepod] " << error << '\n';
        return false;
    }
    return true;
}

void SessionService::setConfig(const ServiceConfig& config) {
    ApplyConfig(config);
}

ServiceConfig SessionService::getConfigSnapshot() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void SessionService::setSessionStore(std::shared_ptr<persist::ISessionStore> store) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    store_ = std::move(store);
}

void SessionService::setBroadcastAdapter(std::shared_ptr<broadcast::IBroadcastAdapter> adapter) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    adapter_ = std::move(adapter);
}

CommandResult SessionService::createSession(const std::string& host_id,
                                            int code_length,
                                            std::chrono::minutes ttl,
                                            const std::string& event_name) {
    const auto config = getConfigSnapshot();
    if (code_length <= 0) {
        code_length = config.sessions.code_length;
    }
    if (ttl.count() <= 0) {
        ttl = std::chrono::minutes(config.sessions.ttl_minutes);
    }

    std::string error;
    auto lease = registry_.Create(host_id, code_length, ttl, config.defaults, util::Clock::now(), &error);
    if (!lease.valid()) {
        Log("[tablepod] create session failed: " + error);
        return CommandResult::Error(CommandStatus::InvalidArgument, error);
    }
    lease->event_name = event_name;
    const model::Session snapshot = lease.session();
    lease.Release();

    Persist(snapshot);
    CommandResult result;
    result.code = snapshot.code;
    return result;
}

JoinResult SessionService::join(const std::string& code,
                                const std::string& participant_id,
                                const std::string& name,
                                const std::string& role) {
    JoinResult result;
    const auto reject = [&result](CommandStatus status, std::string message) {
        result.status = status;
        result.message = std::move(message);
        return result;
    };

    if (code.empty()) {
        return reject(CommandStatus::InvalidArgument, "Code is required");
    }
    if (participant_id.empty()) {
        return reject(CommandStatus::InvalidArgument, "Participant id is required");
    }

    auto lease = registry_.Acquire(code);
    if (!lease.valid()) {
        return reject(CommandStatus::SessionNotFound, "Session is invalid");
    }
    auto& session = lease.session();
    const auto now = util::Clock::now();
    if (session.IsExpired(now)) {
        return reject(CommandStatus::SessionNotFound, "Session has expired");
    }
    if (session.ended) {
        return reject(CommandStatus::SessionEnded, "Game has ended");
    }
    if (session.started && !session.settings.allow_join_after_start) {
        return reject(CommandStatus::JoinClosed, "Game has started");
    }
    if (session.participants.count(participant_id) > 0) {
        return reject(CommandStatus::DuplicateParticipant,
                      "A user with the id " + participant_id + " is already in the game");
    }

    model::Participant participant;
    participant.id = participant_id;
    participant.name = name.empty() ? participant_id : name;
    participant.role = role;
    participant.joined_at = now;
    session.participants.emplace(participant_id, participant);
    const model::Session snapshot = session;
    lease.Release();

    result.participant = participant;
    Persist(snapshot);
    Publish(broadcast::SessionEventType::ParticipantJoined, snapshot,
            {{"participant", persist::ParticipantToJson(participant)}});
    return result;
}

CommandResult SessionService::generateRound(const std::string& code, session::RoundCommand command) {
    return RunCommand(code, session::ToString(command),
                      [command](session::RoundController& controller, model::Session& session) {
                          return controller.GenerateRound(session, command, util::Clock::now());
                      },
                      broadcast::SessionEventType::RoundGenerated);
}

CommandResult SessionService::startRound(const std::string& code) {
    return RunCommand(code, "start",
                      [](session::RoundController& controller, model::Session& session) {
                          return controller.StartRound(session, util::Clock::now());
                      },
                      broadcast::SessionEventType::RoundStarted);
}

CommandResult SessionService::resetRound(const std::string& code) {
    return RunCommand(code, "reset",
                      [](session::RoundController& controller, model::Session& session) {
                          return controller.ResetRound(session);
                      },
                      std::nullopt);
}

session::OutcomeReport SessionService::reportOutcome(const std::string& code, const session::OutcomeRequest& request) {
    session::OutcomeReport report;
    if (code.empty() || request.participant_id.empty()) {
        report.status = session::ReportOutcomeStatus::Invalid;
        report.message = "Code and participant id are required";
        return report;
    }

    auto lease = registry_.Acquire(code);
    const auto now = util::Clock::now();
    if (!lease.valid() || lease->IsExpired(now)) {
        report.status = session::ReportOutcomeStatus::RoomNotFound;
        report.message = "Session not found or expired";
        return report;
    }

    const auto controller = MakeController();
    report = controller.ReportOutcome(lease.session(), request, now);
    if (!report.ok()) {
        return report;
    }
    const model::Session snapshot = lease.session();
    lease.Release();

    Persist(snapshot);
    switch (request.outcome) {
        case session::OutcomeType::DropOut:
            Log("[tablepod] " + snapshot.code + ": " + request.participant_id + " dropped out");
            Publish(broadcast::SessionEventType::ParticipantDropped, snapshot,
                    {{"participant", persist::ParticipantToJson(*report.removed_participant)}});
            break;
        case session::OutcomeType::Win:
        case session::OutcomeType::Draw: {
            nlohmann::json payload;
            payload["outcome"] = session::ToString(request.outcome);
            payload["table"] = report.table_number.value_or(0);
            payload["winner_id"] = report.winner_id.has_value() ? nlohmann::json(*report.winner_id) : nullptr;
            Publish(broadcast::SessionEventType::GameEnded, snapshot, std::move(payload));
            break;
        }
        case session::OutcomeType::DataOnly:
            break;
    }
    return report;
}

CommandResult SessionService::createCustomGroup(const std::string& code,
                                                const std::vector<std::string>& participant_ids,
                                                bool auto_fill) {
    return RunCommand(code, "create-group",
                      [&participant_ids, auto_fill](session::RoundController& controller, model::Session& session) {
                          return controller.CreateCustomGroup(session, participant_ids, auto_fill);
                      },
                      std::nullopt);
}

CommandResult SessionService::deleteCustomGroup(const std::string& code, const std::string& group_id) {
    return RunCommand(code, "delete-group",
                      [&group_id](session::RoundController& controller, model::Session& session) {
                          return controller.DeleteCustomGroup(session, group_id);
                      },
                      std::nullopt);
}

CommandResult SessionService::moveParticipant(const std::string& code,
                                              int source_table,
                                              int target_table,
                                              int round_number,
                                              const std::string& participant_id) {
    return RunCommand(code, "move",
                      [&](session::RoundController& controller, model::Session& session) {
                          return controller.MoveParticipant(session, source_table, target_table, round_number,
                                                            participant_id);
                      },
                      std::nullopt);
}

CommandResult SessionService::setTableResult(const std::string& code,
                                             int table_number,
                                             model::ResultKind result,
                                             const std::string& winner_id) {
    std::optional<broadcast::SessionEventType> event;
    if (result != model::ResultKind::None) {
        event = broadcast::SessionEventType::GameEnded;
    }
    return RunCommand(code, "set-result",
                      [&](session::RoundController& controller, model::Session& session) {
                          return controller.SetTableResult(session, table_number, result, winner_id,
                                                           util::Clock::now());
                      },
                      event);
}

CommandResult SessionService::endRound(const std::string& code) {
    return RunCommand(code, "end-round",
                      [](session::RoundController& controller, model::Session& session) {
                          return controller.EndRound(session, util::Clock::now());
                      },
                      std::nullopt);
}

CommandResult SessionService::endGame(const std::string& code) {
    return RunCommand(code, "end-game",
                      [](session::RoundController& controller, model::Session& session) {
                          return controller.EndGame(session, util::Clock::now());
                      },
                      broadcast::SessionEventType::GameEnded);
}

CommandResult SessionService::updateSettings(const std::string& code,
                                             const std::string& host_id,
                                             const model::Settings& settings,
                                             const std::string& event_name) {
    if (host_id.empty()) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "HostId is required to update settings");
    }
    if (settings.max_table_size < 3 || settings.max_table_size > 4) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "Max table size must be 3 or 4");
    }
    if (settings.round_length_minutes <= 0 || settings.max_rounds < 0) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "Round length and max rounds must be positive");
    }

    return RunCommand(code, "settings",
                      [&](session::RoundController&, model::Session& session) {
                          if (session.host_id != host_id) {
                              return CommandResult::Error(CommandStatus::NotAuthorized,
                                                          "Only the host may change settings");
                          }
                          if (session.ended) {
                              return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
                          }
                          session.settings = settings;
                          if (!event_name.empty()) {
                              session.event_name = event_name;
                          }
                          session::RoundController::RecomputePoints(session);
                          CommandResult result;
                          result.round_number = session.current_round;
                          return result;
                      },
                      broadcast::SessionEventType::SettingsChanged);
}

std::optional<model::Session> SessionService::getSession(const std::string& code) {
    auto lease = registry_.Acquire(code);
    if (!lease.valid()) {
        return std::nullopt;
    }
    return lease.session();
}

std::vector<StandingRow> SessionService::getStandings(const std::string& code) {
    std::vector<StandingRow> rows;
    auto lease = registry_.Acquire(code);
    if (!lease.valid()) {
        return rows;
    }
    const auto table = stats::StandingsTable::FromSession(lease.session());
    lease.Release();

    for (const auto& entry : table.Ranked()) {
        StandingRow row;
        row.id = entry.id;
        row.name = entry.name;
        row.games = entry.games;
        row.wins = entry.wins;
        row.draws = entry.draws;
        row.losses = entry.losses;
        row.byes = entry.byes;
        row.points = entry.points;
        row.winPercent = entry.win_percent();
        row.active = entry.active;
        rows.push_back(std::move(row));
    }
    return rows;
}

bool SessionService::exportResults(const std::string& code, const std::string& directory, std::string* error) {
    const auto snapshot = getSession(code);
    if (!snapshot.has_value()) {
        if (error) {
            *error = "Session not found: " + code;
        }
        return false;
    }
    const auto ranked = stats::StandingsTable::FromSession(*snapshot).Ranked();
    const std::filesystem::path base(directory);
    if (!exporter::WriteStandingsCsv((base / (snapshot->code + "_standings.csv")).string(), ranked, error)) {
        return false;
    }
    if (!exporter::WriteSummaryJson((base / (snapshot->code + "_summary.json")).string(), *snapshot, error)) {
        return false;
    }
    Log("[tablepod] exported " + snapshot->code + " to " + directory);
    return true;
}

bool SessionService::invalidateSession(const std::string& code) {
    model::Session removed;
    if (!registry_.Remove(code, &removed)) {
        return false;
    }
    Log("[tablepod] invalidated " + removed.code);
    Publish(broadcast::SessionEventType::SessionExpired, removed, nlohmann::json::object());
    return true;
}

size_t SessionService::sweepExpired(util::TimePoint now) {
    auto swept = registry_.SweepExpired(now);
    const size_t count = swept.size();
    OnSwept(std::move(swept));
    return count;
}

void SessionService::startSweeper() {
    const auto config = getConfigSnapshot();
    const auto interval = std::chrono::seconds(std::max(1, config.sessions.sweep_interval_seconds));
    registry_.StartSweeper(std::chrono::duration_cast<std::chrono::milliseconds>(interval),
                           [this](std::vector<model::Session> swept) { OnSwept(std::move(swept)); });
}

void SessionService::stopSweeper() {
    registry_.StopSweeper();
}

int SessionService::restoreSessions(std::string* error) {
    std::shared_ptr<persist::ISessionStore> store;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        store = store_;
    }
    if (!store) {
        if (error) {
            *error = "No session store configured";
        }
        return 0;
    }

    std::string load_error;
    auto sessions = store->LoadAll(&load_error);
    if (!load_error.empty()) {
        Log("[tablepod] restore: " + load_error);
        if (error) {
            *error = load_error;
        }
    }

    const auto now = util::Clock::now();
    int restored = 0;
    for (auto& session : sessions) {
        if (session.IsExpired(now) && !session.ended) {
            session.ArchiveCurrentRound(now);
            session.ended = true;
        }
        std::string insert_error;
        if (!registry_.Insert(std::move(session), &insert_error)) {
            Log("[tablepod] restore: " + insert_error);
            continue;
        }
        ++restored;
    }
    Log("[tablepod] restored " + std::to_string(restored) + " sessions");
    return restored;
}

std::string SessionService::getLastLogLines(int n) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    const int start = std::max(0, static_cast<int>(log_lines_.size()) - n);
    std::ostringstream output;
    for (size_t i = static_cast<size_t>(start); i < log_lines_.size(); ++i) {
        output << log_lines_[i];
        if (i + 1 < log_lines_.size()) {
            output << '\n';
        }
    }
    return output.str();
}

CommandResult SessionService::RunCommand(const std::string& code,
                                         const char* name,
                                         const SessionCommand& command,
                                         std::optional<broadcast::SessionEventType> event) {
    if (code.empty()) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "Code is required");
    }

    auto lease = registry_.Acquire(code);
    auto available = CheckAvailable(lease, code);
    if (!available.ok()) {
        return available;
    }

    auto controller = MakeController();
    auto result = command(controller, lease.session());
    result.code = lease->code;
    if (!result.ok()) {
        Log(std::string("[tablepod] ") + lease->code + ": " + name + " rejected (" +
            session::ToString(result.status) + "): " + result.message);
        return result;
    }
    const model::Session snapshot = lease.session();
    lease.Release();

    Persist(snapshot);
    if (event.has_value()) {
        Publish(*event, snapshot, TablesPayload(snapshot));
    }
    return result;
}

session::RoundController SessionService::MakeController() const {
    const auto config = getConfigSnapshot();
    session::ControllerOptions options;
    options.min_participants = config.sessions.min_participants;
    options.selector = config.selector_options();
    return session::RoundController(random_, options, [this](const std::string& line) { Log(line); });
}

CommandResult SessionService::CheckAvailable(const session::SessionLease& lease, const std::string& code) const {
    if (!lease.valid()) {
        return Unavailable(code, "Code is invalid or expired");
    }
    if (lease.session().IsExpired(util::Clock::now())) {
        return Unavailable(code, "Session has expired");
    }
    CommandResult result;
    result.code = lease.session().code;
    return result;
}

void SessionService::Persist(const model::Session& snapshot) {
    std::shared_ptr<persist::ISessionStore> store;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        store = store_;
    }
    if (!store) {
        return;
    }
    std::string error;
    try {
        if (!store->Save(snapshot, &error)) {
            Log("[tablepod] save failed for " + snapshot.code + ": " + error);
        }
    } catch (const std::exception& ex) {
        Log("[tablepod] save failed for " + snapshot.code + ": " + ex.what());
    }
}

void SessionService::Publish(broadcast::SessionEventType type, const model::Session& snapshot, nlohmann::json payload) {
    broadcast::SessionEvent event;
    event.type = type;
    event.code = snapshot.code;
    event.payload = std::move(payload);
    if (!event.payload.is_object()) {
        event.payload = nlohmann::json::object();
    }
    event.payload["session"] = persist::SessionToJson(snapshot);

    events_.Emit(event);

    std::shared_ptr<broadcast::IBroadcastAdapter> adapter;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        adapter = adapter_;
    }
    if (!adapter) {
        return;
    }
    try {
        if (!adapter->Publish(event)) {
            Log(std::string("[tablepod] broadcast of ") + broadcast::ToString(type) + " failed for " + snapshot.code);
        }
    } catch (const std::exception& ex) {
        Log(std::string("[tablepod] broadcast of ") + broadcast::ToString(type) + " failed: " + ex.what());
    }
}

void SessionService::OnSwept(std::vector<model::Session> swept) {
    for (const auto& session : swept) {
        Log("[tablepod] session " + session.code + " expired");
        Persist(session);
        Publish(broadcast::SessionEventType::SessionExpired, session, nlohmann::json::object());
    }
}

void SessionService::ApplyConfig(const ServiceConfig& config) {
    std::shared_ptr<persist::ISessionStore> store;
    if (config.storage.enabled) {
        store = std::make_shared<persist::JsonFileSessionStore>(
            config.storage.sessions_dir, [this](const std::string& line) { Log(line); });
    }

    std::shared_ptr<broadcast::IBroadcastAdapter> adapter;
    if (config.broadcast.adapter == "event_feed") {
        auto feed = std::make_shared<broadcast::EventFeedWriter>();
        feed->set_include_session(config.broadcast.include_session);
        if (feed->Configure(config.broadcast.feed_path)) {
            adapter = std::move(feed);
        }
    } else if (!config.broadcast.adapter.empty()) {
        Log("[tablepod] unknown broadcast adapter: " + config.broadcast.adapter);
    }

    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        max_log_lines_ = static_cast<size_t>(std::max(1, config.logging.max_lines));
        mirror_stderr_ = config.logging.mirror_stderr;
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
    store_ = std::move(store);
    adapter_ = std::move(adapter);
}

void SessionService::Log(const std::string& line) const {
    bool mirror = false;
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        mirror = mirror_stderr_;
    }
    if (mirror) {
        std::cerr << line << '\n';
    }
    AppendLogLine(line);
}

void SessionService::AppendLogLine(const std::string& line) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    while (log_lines_.size() >= max_log_lines_) {
        log_lines_.pop_front();
    }
    log_lines_.push_back(line);
}

}  // namespace tablepod::core::api
