#include "tablepod/core/session/CommandResult.h"

namespace tablepod::core::session {

const char* ToString(CommandStatus status) {
    switch (status) {
        case CommandStatus::Success:
            return "success";
        case CommandStatus::InvalidArgument:
            return "invalid_argument";
        case CommandStatus::SessionNotFound:
            return "session_not_found";
        case CommandStatus::SessionEnded:
            return "session_ended";
        case CommandStatus::NotStarted:
            return "not_started";
        case CommandStatus::AlreadyStarted:
            return "already_started";
        case CommandStatus::RoundInProgress:
            return "round_in_progress";
        case CommandStatus::InsufficientParticipants:
            return "insufficient_participants";
        case CommandStatus::MaxRoundsReached:
            return "max_rounds_reached";
        case CommandStatus::TableNotFound:
            return "table_not_found";
        case CommandStatus::ParticipantNotFound:
            return "participant_not_found";
        case CommandStatus::CustomGroupsDisabled:
            return "custom_groups_disabled";
        case CommandStatus::ResultAlreadyRecorded:
            return "result_already_recorded";
        case CommandStatus::DuplicateParticipant:
            return "duplicate_participant";
        case CommandStatus::JoinClosed:
            return "join_closed";
        case CommandStatus::NotAuthorized:
            return "not_authorized";
        case CommandStatus::ArchivedRoundImmutable:
            return "archived_round_immutable";
        case CommandStatus::TableSizeLimit:
            return "table_size_limit";
    }
    return "unknown";
}

}  // namespace tablepod::core::session
