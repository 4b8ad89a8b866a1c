#pragma once

#include "tablepod/core/model/Table.h"

#include <optional>
#include <string>

namespace tablepod::core::session {

enum class CommandStatus {
    Success,
    InvalidArgument,
    SessionNotFound,
    SessionEnded,
    NotStarted,
    AlreadyStarted,
    RoundInProgress,
    InsufficientParticipants,
    MaxRoundsReached,
    TableNotFound,
    ParticipantNotFound,
    CustomGroupsDisabled,
    ResultAlreadyRecorded,
    DuplicateParticipant,
    JoinClosed,
    NotAuthorized,
    ArchivedRoundImmutable,
    TableSizeLimit
};

const char* ToString(CommandStatus status);

struct CommandResult {
    CommandStatus status = CommandStatus::Success;
    std::string message;
    std::string code;
    // Current tables after the command; empty when the session has none.
    model::Round tables;
    int round_number = 0;
    std::string participant_id;
    std::optional<int> source_table;
    std::optional<int> target_table;
    std::string custom_group_id;

    bool ok() const { return status == CommandStatus::Success; }

    static CommandResult Error(CommandStatus status, std::string message) {
        CommandResult result;
        result.status = status;
        result.message = std::move(message);
        return result;
    }
};

}  // namespace tablepod::core::session
