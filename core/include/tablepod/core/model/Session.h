#pragma once

#include "tablepod/core/model/Participant.h"
#include "tablepod/core/model/Settings.h"
#include "tablepod/core/model/Table.h"
#include "tablepod/core/util/Timestamp.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tablepod::core::model {

enum class SessionState {
    NotStarted,
    RoundActive,
    Ended
};

struct Session {
    std::string code;
    std::string host_id;
    std::string event_name;
    util::TimePoint created_at{};
    util::TimePoint expires_at{};
    Settings settings;

    // Monotonic; 0 until the first round is generated.
    int current_round = 0;
    std::map<std::string, Participant> participants;
    // Empty until the first round is generated and again after end-round/end-game.
    std::optional<Round> tables;
    // Oldest first. Entries are never modified once appended.
    std::vector<Round> archived_rounds;

    bool started = false;
    bool ended = false;
    bool archived = false;

    SessionState state() const;
    bool IsExpired(util::TimePoint now) const { return now >= expires_at; }
    bool HasTables() const { return tables.has_value() && !tables->empty(); }
    bool HasAnyRoundStarted() const;

    Table* FindTableFor(const std::string& participant_id);
    Table* FindTable(int number);
    const Round* LastArchivedRound() const;

    // Copies the current tables into the archive, stamping completion time on
    // tables that have none, and clears the current round. No-op without tables.
    bool ArchiveCurrentRound(util::TimePoint now);
};

// Value copy of a round with missing completion times stamped.
Round SnapshotRound(const Round& round, util::TimePoint now);

const char* ToString(SessionState state);

}  // namespace tablepod::core::model
