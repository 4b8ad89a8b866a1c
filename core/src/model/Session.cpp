#include "tablepod/core/model/Session.h"

#include <algorithm>

namespace tablepod::core::model {

SessionState Session::state() const {
    if (ended) {
        return SessionState::Ended;
    }
    return current_round > 0 ? SessionState::RoundActive : SessionState::NotStarted;
}

bool Session::HasAnyRoundStarted() const {
    if (!tables.has_value()) {
        return false;
    }
    return std::any_of(tables->begin(), tables->end(), [](const Table& table) {
        return table.round_started;
    });
}

Table* Session::FindTableFor(const std::string& participant_id) {
    if (!tables.has_value()) {
        return nullptr;
    }
    for (auto& table : *tables) {
        if (table.Contains(participant_id)) {
            return &table;
        }
    }
    return nullptr;
}

Table* Session::FindTable(int number) {
    if (!tables.has_value()) {
        return nullptr;
    }
    for (auto& table : *tables) {
        if (table.number == number) {
            return &table;
        }
    }
    return nullptr;
}

const Round* Session::LastArchivedRound() const {
    if (archived_rounds.empty()) {
        return nullptr;
    }
    return &archived_rounds.back();
}

bool Session::ArchiveCurrentRound(util::TimePoint now) {
    if (!HasTables()) {
        tables.reset();
        return false;
    }
    archived_rounds.push_back(SnapshotRound(*tables, now));
    tables.reset();
    return true;
}

Round SnapshotRound(const Round& round, util::TimePoint now) {
    Round snapshot = round;
    for (auto& table : snapshot) {
        if (!table.completed_at.has_value()) {
            table.completed_at = now;
        }
    }
    return snapshot;
}

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::RoundActive:
            return "round_active";
        case SessionState::Ended:
            return "ended";
        case SessionState::NotStarted:
            break;
    }
    return "not_started";
}

}  // namespace tablepod::core::model
