#pragma once

#include "tablepod/core/model/Session.h"
#include "tablepod/core/pairing/RoundTypes.h"
#include "tablepod/core/session/CommandResult.h"
#include "tablepod/core/util/SecureRandom.h"
#include "tablepod/core/util/Timestamp.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tablepod::core::session {

enum class RoundCommand {
    First,
    Next,
    Regenerate
};

enum class OutcomeType {
    Win,
    Draw,
    DropOut,
    // Merges statistics without touching the result.
    DataOnly
};

enum class ReportOutcomeStatus {
    Success,
    RoomNotFound,
    NotStarted,
    ResultAlreadyRecorded,
    ParticipantNotFound,
    RoundInProgress,
    SessionEnded,
    Invalid
};

const char* ToString(RoundCommand command);
bool RoundCommandFromString(const std::string& text, RoundCommand& command);
const char* ToString(OutcomeType type);
bool OutcomeTypeFromString(const std::string& text, OutcomeType& type);
const char* ToString(ReportOutcomeStatus status);

struct OutcomeRequest {
    std::string participant_id;
    OutcomeType outcome = OutcomeType::Win;
    // Applied to the participant when not empty.
    std::string role;
    nlohmann::json statistics = nlohmann::json::object();
};

struct OutcomeReport {
    ReportOutcomeStatus status = ReportOutcomeStatus::Success;
    std::string message;
    std::optional<std::string> winner_id;
    std::optional<model::Participant> removed_participant;
    std::optional<int> table_number;

    bool ok() const { return status == ReportOutcomeStatus::Success; }
};

struct ControllerOptions {
    int min_participants = 6;
    pairing::SelectorOptions selector;
};

// Applies round lifecycle commands to a session. Callers hold the session
// lock for the duration of each call. Rejected commands leave the session
// unchanged.
class RoundController {
public:
    RoundController(util::SecureRandom& random,
                    ControllerOptions options = {},
                    std::function<void(const std::string&)> log_fn = {});

    // Throws std::logic_error if generation produces an inconsistent round;
    // the session is untouched in that case.
    CommandResult GenerateRound(model::Session& session, RoundCommand command, util::TimePoint now) const;
    CommandResult StartRound(model::Session& session, util::TimePoint now) const;
    CommandResult ResetRound(model::Session& session) const;

    CommandResult CreateCustomGroup(model::Session& session,
                                    const std::vector<std::string>& participant_ids,
                                    bool auto_fill) const;
    CommandResult DeleteCustomGroup(model::Session& session, const std::string& group_id) const;

    CommandResult MoveParticipant(model::Session& session,
                                  int source_table,
                                  int target_table,
                                  int round_number,
                                  const std::string& participant_id) const;
    CommandResult SetTableResult(model::Session& session,
                                 int table_number,
                                 model::ResultKind result,
                                 const std::string& winner_id,
                                 util::TimePoint now) const;

    CommandResult EndRound(model::Session& session, util::TimePoint now) const;
    CommandResult EndGame(model::Session& session, util::TimePoint now) const;

    OutcomeReport ReportOutcome(model::Session& session, const OutcomeRequest& request, util::TimePoint now) const;

    // Rebuilds every participant's points from the archive and current tables.
    // No-op unless the session uses points.
    static void RecomputePoints(model::Session& session);

    const ControllerOptions& options() const { return options_; }

private:
    CommandResult Success(const model::Session& session) const;
    void Log(const std::string& message) const;

    util::SecureRandom& random_;
    ControllerOptions options_;
    std::function<void(const std::string&)> log_fn_;
};

}  // namespace tablepod::core::session
