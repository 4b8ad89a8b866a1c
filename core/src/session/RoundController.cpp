#include "tablepod/core/session/RoundController.h"

#include "tablepod/core/pairing/CustomTableResolver.h"
#include "tablepod/core/pairing/RoundGenerator.h"
#include "tablepod/core/stats/StandingsTable.h"

#include <algorithm>
#include <set>
#include <sstream>

namespace tablepod::core::session {

namespace {

constexpr size_t kCustomGroupIdLength = 16;
const char* const kCustomGroupIdAlphabet = "0123456789abcdef";
constexpr int kMinimumSeatsAfterMove = 3;

void SyncRolesIntoSeats(model::Session& session) {
    if (!session.tables.has_value()) {
        return;
    }
    for (auto& table : *session.tables) {
        for (auto& seat : table.seats) {
            const auto it = session.participants.find(seat.id);
            if (it != session.participants.end()) {
                seat.role = it->second.role;
            }
        }
    }
}

void MergeStatistics(model::Table& table, const nlohmann::json& statistics) {
    if (!statistics.is_object()) {
        return;
    }
    if (!table.statistics.is_object()) {
        table.statistics = nlohmann::json::object();
    }
    for (auto it = statistics.begin(); it != statistics.end(); ++it) {
        table.statistics[it.key()] = it.value();
    }
}

OutcomeReport Reject(ReportOutcomeStatus status, std::string message) {
    OutcomeReport report;
    report.status = status;
    report.message = std::move(message);
    return report;
}

}  // namespace

const char* ToString(RoundCommand command) {
    switch (command) {
        case RoundCommand::First:
            return "first";
        case RoundCommand::Next:
            return "next";
        case RoundCommand::Regenerate:
            return "regenerate";
    }
    return "unknown";
}

bool RoundCommandFromString(const std::string& text, RoundCommand& command) {
    if (text == "first") {
        command = RoundCommand::First;
    } else if (text == "next") {
        command = RoundCommand::Next;
    } else if (text == "regenerate") {
        command = RoundCommand::Regenerate;
    } else {
        return false;
    }
    return true;
}

const char* ToString(OutcomeType type) {
    switch (type) {
        case OutcomeType::Win:
            return "win";
        case OutcomeType::Draw:
            return "draw";
        case OutcomeType::DropOut:
            return "drop";
        case OutcomeType::DataOnly:
            return "data";
    }
    return "unknown";
}

bool OutcomeTypeFromString(const std::string& text, OutcomeType& type) {
    if (text == "win") {
        type = OutcomeType::Win;
    } else if (text == "draw") {
        type = OutcomeType::Draw;
    } else if (text == "drop" || text == "dropout") {
        type = OutcomeType::DropOut;
    } else if (text == "data") {
        type = OutcomeType::DataOnly;
    } else {
        return false;
    }
    return true;
}

const char* ToString(ReportOutcomeStatus status) {
    switch (status) {
        case ReportOutcomeStatus::Success:
            return "success";
        case ReportOutcomeStatus::RoomNotFound:
            return "room_not_found";
        case ReportOutcomeStatus::NotStarted:
            return "not_started";
        case ReportOutcomeStatus::ResultAlreadyRecorded:
            return "result_already_recorded";
        case ReportOutcomeStatus::ParticipantNotFound:
            return "participant_not_found";
        case ReportOutcomeStatus::RoundInProgress:
            return "round_in_progress";
        case ReportOutcomeStatus::SessionEnded:
            return "session_ended";
        case ReportOutcomeStatus::Invalid:
            return "invalid";
    }
    return "unknown";
}

RoundController::RoundController(util::SecureRandom& random,
                                 ControllerOptions options,
                                 std::function<void(const std::string&)> log_fn)
    : random_(random), options_(options), log_fn_(std::move(log_fn)) {}

CommandResult RoundController::GenerateRound(model::Session& session,
                                             RoundCommand command,
                                             util::TimePoint now) const {
    if (session.ended) {
        return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
    }

    int round_number = 0;
    switch (command) {
        case RoundCommand::First:
            if (session.current_round > 0) {
                return CommandResult::Error(CommandStatus::AlreadyStarted, "First round already generated");
            }
            round_number = 1;
            break;
        case RoundCommand::Next:
            if (session.current_round == 0) {
                return CommandResult::Error(CommandStatus::NotStarted, "Generate the first round before the next one");
            }
            if (session.settings.max_rounds > 0 && session.current_round >= session.settings.max_rounds) {
                return CommandResult::Error(CommandStatus::MaxRoundsReached,
                                            "Maximum of " + std::to_string(session.settings.max_rounds) +
                                                " rounds reached");
            }
            round_number = session.current_round + 1;
            break;
        case RoundCommand::Regenerate:
            if (session.current_round == 0 || !session.HasTables()) {
                return CommandResult::Error(CommandStatus::NotStarted, "No current round to regenerate");
            }
            if (session.HasAnyRoundStarted()) {
                return CommandResult::Error(CommandStatus::RoundInProgress,
                                            "Cannot regenerate after a table has started");
            }
            if (std::any_of(session.tables->begin(), session.tables->end(),
                            [](const model::Table& table) { return table.has_result(); })) {
                return CommandResult::Error(CommandStatus::ResultAlreadyRecorded,
                                            "Cannot regenerate a round with recorded results");
            }
            round_number = session.current_round;
            break;
    }

    const int active = static_cast<int>(session.participants.size());
    if (active < options_.min_participants) {
        return CommandResult::Error(CommandStatus::InsufficientParticipants,
                                    "At least " + std::to_string(options_.min_participants) +
                                        " participants are required, have " + std::to_string(active));
    }

    // Everything below works on copies; the session changes only on commit.
    std::vector<model::Round> archive = session.archived_rounds;
    if (command == RoundCommand::Next && session.HasTables()) {
        archive.push_back(model::SnapshotRound(*session.tables, now));
    }

    auto participants = session.participants;
    const int dissolved = pairing::CustomTableResolver::DissolveSingletonGroups(participants);
    if (dissolved > 0) {
        Log("dissolved " + std::to_string(dissolved) + " single-member custom groups");
    }

    pairing::RoundContext context;
    context.round_number = round_number;
    context.first_round = (round_number == 1);
    context.settings = session.settings;
    context.participants.reserve(participants.size());
    for (const auto& [id, participant] : participants) {
        context.participants.push_back(participant);
    }

    const pairing::RoundGenerator generator(random_, options_.selector, log_fn_);
    auto tables = generator.BuildRound(context, archive);

    session.participants = std::move(participants);
    session.archived_rounds = std::move(archive);
    session.tables = std::move(tables);
    session.current_round = round_number;
    session.started = true;
    RecomputePoints(session);

    std::ostringstream message;
    message << session.code << ": " << ToString(command) << " -> round " << round_number << ", "
            << session.tables->size() << " tables";
    Log(message.str());
    return Success(session);
}

CommandResult RoundController::StartRound(model::Session& session, util::TimePoint now) const {
    if (session.ended) {
        return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
    }
    if (!session.HasTables()) {
        return CommandResult::Error(CommandStatus::NotStarted, "No tables available to start");
    }
    for (auto& table : *session.tables) {
        if (table.round_started) {
            continue;
        }
        table.round_started = true;
        table.started_at = now;
    }
    SyncRolesIntoSeats(session);
    return Success(session);
}

CommandResult RoundController::ResetRound(model::Session& session) const {
    if (session.ended) {
        return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
    }
    if (!session.HasTables()) {
        return CommandResult::Error(CommandStatus::NotStarted, "No tables available to reset");
    }
    for (auto& table : *session.tables) {
        table.round_started = false;
        table.started_at.reset();
        table.completed_at.reset();
        table.ClearResult();
    }
    SyncRolesIntoSeats(session);
    RecomputePoints(session);
    return Success(session);
}

CommandResult RoundController::CreateCustomGroup(model::Session& session,
                                                 const std::vector<std::string>& participant_ids,
                                                 bool auto_fill) const {
    if (session.ended) {
        return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
    }
    if (!session.settings.allow_custom_groups) {
        return CommandResult::Error(CommandStatus::CustomGroupsDisabled,
                                    "Custom groups are not allowed for this session");
    }
    if (participant_ids.size() < 2) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "A custom group needs at least two participants");
    }
    if (static_cast<int>(participant_ids.size()) > session.settings.max_table_size) {
        return CommandResult::Error(CommandStatus::TableSizeLimit,
                                    "A custom group holds at most " +
                                        std::to_string(session.settings.max_table_size) + " participants");
    }
    const std::set<std::string> unique_ids(participant_ids.begin(), participant_ids.end());
    if (unique_ids.size() != participant_ids.size()) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "Participant listed twice");
    }
    if (session.HasAnyRoundStarted()) {
        return CommandResult::Error(CommandStatus::RoundInProgress,
                                    "Cannot create custom groups after the round has started");
    }
    for (const auto& id : participant_ids) {
        if (session.participants.count(id) == 0) {
            auto result = CommandResult::Error(CommandStatus::ParticipantNotFound,
                                               "Participant " + id + " not found in session");
            result.participant_id = id;
            return result;
        }
    }

    const auto group_id = random_.Token(kCustomGroupIdLength, kCustomGroupIdAlphabet);
    for (const auto& id : participant_ids) {
        auto& participant = session.participants.at(id);
        participant.custom_group_id = group_id;
        participant.auto_fill = auto_fill;
    }
    // Groups that lost members to the new one may be down to one.
    pairing::CustomTableResolver::DissolveSingletonGroups(session.participants);

    auto result = Success(session);
    result.custom_group_id = group_id;
    return result;
}

CommandResult RoundController::DeleteCustomGroup(model::Session& session, const std::string& group_id) const {
    if (session.ended) {
        return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
    }
    if (group_id.empty()) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "Custom group id is required");
    }
    if (session.HasAnyRoundStarted()) {
        return CommandResult::Error(CommandStatus::RoundInProgress,
                                    "Cannot delete custom groups after the round has started");
    }
    int cleared = 0;
    for (auto& [id, participant] : session.participants) {
        if (participant.custom_group_id != group_id) {
            continue;
        }
        participant.custom_group_id.clear();
        participant.auto_fill = false;
        ++cleared;
    }
    if (cleared == 0) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "Custom group " + group_id + " not found");
    }
    auto result = Success(session);
    result.custom_group_id = group_id;
    return result;
}

CommandResult RoundController::MoveParticipant(model::Session& session,
                                               int source_table,
                                               int target_table,
                                               int round_number,
                                               const std::string& participant_id) const {
    if (session.ended) {
        return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
    }
    if (round_number != session.current_round) {
        if (round_number > 0 && round_number < session.current_round) {
            return CommandResult::Error(CommandStatus::ArchivedRoundImmutable,
                                        "Round " + std::to_string(round_number) + " is archived");
        }
        return CommandResult::Error(CommandStatus::InvalidArgument,
                                    "Round " + std::to_string(round_number) + " is not the current round");
    }
    if (!session.HasTables()) {
        return CommandResult::Error(CommandStatus::NotStarted, "No tables available");
    }
    if (source_table == target_table) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "Source and target table are the same");
    }

    auto* source = session.FindTable(source_table);
    if (source == nullptr) {
        return CommandResult::Error(CommandStatus::TableNotFound, "Source table not found");
    }
    auto* target = session.FindTable(target_table);
    if (target == nullptr) {
        return CommandResult::Error(CommandStatus::TableNotFound, "Target table not found");
    }
    const auto* seat = source->Find(participant_id);
    if (seat == nullptr) {
        return CommandResult::Error(CommandStatus::ParticipantNotFound, "Participant not found in source table");
    }
    if (source->has_result() || target->has_result()) {
        return CommandResult::Error(CommandStatus::ResultAlreadyRecorded,
                                    "Cannot move participants between decided tables");
    }
    if (!source->is_bye() && source->size() - 1 < kMinimumSeatsAfterMove) {
        return CommandResult::Error(CommandStatus::TableSizeLimit,
                                    "Source table would drop below " + std::to_string(kMinimumSeatsAfterMove) +
                                        " seats");
    }
    if (!target->is_bye() && target->size() + 1 > session.settings.max_table_size) {
        return CommandResult::Error(CommandStatus::TableSizeLimit,
                                    "Target table already holds " + std::to_string(target->size()) + " seats");
    }

    model::Participant moved = *seat;
    source->RemoveSeat(participant_id);
    moved.order = target->size() + 1;
    target->AddSeat(moved);

    auto result = Success(session);
    result.participant_id = participant_id;
    result.source_table = source_table;
    result.target_table = target_table;
    return result;
}

CommandResult RoundController::SetTableResult(model::Session& session,
                                              int table_number,
                                              model::ResultKind result_kind,
                                              const std::string& winner_id,
                                              util::TimePoint now) const {
    if (session.ended) {
        return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
    }
    if (!session.HasTables()) {
        return CommandResult::Error(CommandStatus::NotStarted, "No tables available");
    }
    auto* table = session.FindTable(table_number);
    if (table == nullptr) {
        return CommandResult::Error(CommandStatus::TableNotFound, "Table not found");
    }
    if (table->is_bye() && result_kind != model::ResultKind::None) {
        return CommandResult::Error(CommandStatus::InvalidArgument, "The bye table has no result");
    }

    switch (result_kind) {
        case model::ResultKind::Win:
            if (!table->Contains(winner_id)) {
                auto result = CommandResult::Error(CommandStatus::ParticipantNotFound,
                                                   "Winner is not seated at table " + std::to_string(table_number));
                result.participant_id = winner_id;
                return result;
            }
            table->SetWinner(winner_id);
            table->completed_at = now;
            break;
        case model::ResultKind::Draw:
            table->SetDraw();
            table->completed_at = now;
            break;
        case model::ResultKind::None:
            table->ClearResult();
            table->completed_at.reset();
            break;
    }
    RecomputePoints(session);

    auto result = Success(session);
    result.target_table = table_number;
    result.participant_id = winner_id;
    return result;
}

CommandResult RoundController::EndRound(model::Session& session, util::TimePoint now) const {
    if (session.ended) {
        return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
    }
    if (!session.HasTables()) {
        return CommandResult::Error(CommandStatus::NotStarted, "No current round to end");
    }
    session.ArchiveCurrentRound(now);
    RecomputePoints(session);
    Log(session.code + ": round " + std::to_string(session.current_round) + " archived");
    return Success(session);
}

CommandResult RoundController::EndGame(model::Session& session, util::TimePoint now) const {
    if (session.ended) {
        return CommandResult::Error(CommandStatus::SessionEnded, "Session has ended");
    }
    session.ArchiveCurrentRound(now);
    session.ended = true;
    RecomputePoints(session);
    Log(session.code + ": game ended after " + std::to_string(session.archived_rounds.size()) + " rounds");
    return Success(session);
}

OutcomeReport RoundController::ReportOutcome(model::Session& session,
                                             const OutcomeRequest& request,
                                             util::TimePoint now) const {
    if (request.participant_id.empty()) {
        return Reject(ReportOutcomeStatus::Invalid, "Participant id is required");
    }
    if (session.ended) {
        return Reject(ReportOutcomeStatus::SessionEnded, "Session has ended");
    }

    if (request.outcome == OutcomeType::DropOut) {
        if (session.HasAnyRoundStarted()) {
            return Reject(ReportOutcomeStatus::RoundInProgress, "Cannot drop out after the round has started");
        }
        const auto it = session.participants.find(request.participant_id);
        if (it == session.participants.end()) {
            return Reject(ReportOutcomeStatus::ParticipantNotFound, "Participant not found");
        }
        model::Participant removed = it->second;
        removed.dropped = true;
        session.participants.erase(it);
        pairing::CustomTableResolver::DissolveSingletonGroups(session.participants);

        OutcomeReport report;
        report.removed_participant = std::move(removed);
        return report;
    }

    const auto participant = session.participants.find(request.participant_id);
    if (!session.HasTables()) {
        return Reject(ReportOutcomeStatus::NotStarted, "No round in progress");
    }
    auto* table = session.FindTableFor(request.participant_id);
    if (table == nullptr) {
        return Reject(ReportOutcomeStatus::ParticipantNotFound, "Participant is not seated in the current round");
    }
    if (request.outcome != OutcomeType::DataOnly) {
        if (table->has_result()) {
            return Reject(ReportOutcomeStatus::ResultAlreadyRecorded,
                          "Table " + std::to_string(table->number) + " already has a result");
        }
        if (table->is_bye()) {
            return Reject(ReportOutcomeStatus::Invalid, "The bye table has no result");
        }
        if (request.outcome == OutcomeType::Win && participant == session.participants.end()) {
            return Reject(ReportOutcomeStatus::ParticipantNotFound, "Participant is no longer active");
        }
    }

    if (!request.role.empty() && participant != session.participants.end()) {
        participant->second.role = request.role;
        table->Find(request.participant_id)->role = request.role;
    }
    MergeStatistics(*table, request.statistics);

    OutcomeReport report;
    report.table_number = table->number;
    switch (request.outcome) {
        case OutcomeType::Win:
            table->SetWinner(request.participant_id);
            table->completed_at = now;
            report.winner_id = request.participant_id;
            break;
        case OutcomeType::Draw:
            table->SetDraw();
            table->completed_at = now;
            break;
        case OutcomeType::DataOnly:
        case OutcomeType::DropOut:
            break;
    }
    RecomputePoints(session);
    return report;
}

void RoundController::RecomputePoints(model::Session& session) {
    if (!session.settings.use_points) {
        return;
    }
    const auto standings = stats::StandingsTable::FromSession(session);
    for (auto& [id, participant] : session.participants) {
        const auto* entry = standings.Find(id);
        participant.points = entry != nullptr ? entry->points : 0;
    }
    if (!session.tables.has_value()) {
        return;
    }
    for (auto& table : *session.tables) {
        for (auto& seat : table.seats) {
            const auto* entry = standings.Find(seat.id);
            seat.points = entry != nullptr ? entry->points : 0;
        }
    }
}

CommandResult RoundController::Success(const model::Session& session) const {
    CommandResult result;
    result.round_number = session.current_round;
    if (session.tables.has_value()) {
        result.tables = *session.tables;
    }
    return result;
}

void RoundController::Log(const std::string& message) const {
    if (log_fn_) {
        log_fn_("[controller] " + message);
    }
}

}  // namespace tablepod::core::session
