#include "tablepod/core/stats/StandingsTable.h"

#include <algorithm>

namespace tablepod::core::stats {

StandingsTable::StandingsTable(const model::Settings& settings) : settings_(settings) {}

StandingsTable StandingsTable::FromSession(const model::Session& session) {
    StandingsTable table(session.settings);
    for (const auto& [id, participant] : session.participants) {
        table.AddParticipant(id, participant.name, true);
    }
    for (const auto& round : session.archived_rounds) {
        table.RecordRound(round);
    }
    if (session.tables.has_value()) {
        table.RecordRound(*session.tables);
    }
    for (auto& entry : table.standings_) {
        entry.active = session.participants.count(entry.id) > 0;
    }
    return table;
}

void StandingsTable::AddParticipant(const std::string& id, const std::string& name, bool active) {
    if (Find(id) != nullptr) {
        return;
    }
    ParticipantStats stats;
    stats.id = id;
    stats.name = name;
    stats.active = active;
    standings_.push_back(std::move(stats));
}

void StandingsTable::RecordTable(const model::Table& table) {
    if (table.is_bye()) {
        for (const auto& seat : table.seats) {
            auto& entry = Entry(seat);
            entry.byes += 1;
            entry.points += settings_.points_for_bye;
        }
        return;
    }

    if (!table.has_result()) {
        return;
    }

    games_played_ += 1;
    for (const auto& seat : table.seats) {
        auto& entry = Entry(seat);
        entry.games += 1;
        if (table.result == model::ResultKind::Draw) {
            entry.draws += 1;
            entry.points += settings_.points_for_draw;
        } else if (seat.id == table.winner_id) {
            entry.wins += 1;
            entry.points += settings_.points_for_win;
        } else {
            entry.losses += 1;
            entry.points += settings_.points_for_loss;
        }
    }
}

void StandingsTable::RecordRound(const model::Round& round) {
    for (const auto& table : round) {
        RecordTable(table);
    }
}

std::vector<ParticipantStats> StandingsTable::Ranked() const {
    auto sorted = standings_;
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        if (a.points != b.points) {
            return a.points > b.points;
        }
        if (a.wins != b.wins) {
            return a.wins > b.wins;
        }
        return a.name < b.name;
    });
    return sorted;
}

const ParticipantStats* StandingsTable::Find(const std::string& id) const {
    for (const auto& entry : standings_) {
        if (entry.id == id) {
            return &entry;
        }
    }
    return nullptr;
}

ParticipantStats& StandingsTable::Entry(const model::Participant& participant) {
    for (auto& entry : standings_) {
        if (entry.id == participant.id) {
            return entry;
        }
    }
    AddParticipant(participant.id, participant.name, false);
    return standings_.back();
}

}  // namespace tablepod::core::stats
