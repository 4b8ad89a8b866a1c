#pragma once

#include "tablepod/core/model/Session.h"
#include "tablepod/core/model/Settings.h"
#include "tablepod/core/model/Table.h"

#include <string>
#include <vector>

namespace tablepod::core::stats {

struct ParticipantStats {
    std::string id;
    std::string name;
    int games = 0;
    int wins = 0;
    int draws = 0;
    int losses = 0;
    int byes = 0;
    int points = 0;
    // False once the participant dropped out of the session.
    bool active = true;

    double win_percent() const {
        if (games == 0) {
            return 0.0;
        }
        return (static_cast<double>(wins) / static_cast<double>(games)) * 100.0;
    }
};

class StandingsTable {
public:
    explicit StandingsTable(const model::Settings& settings);

    // Every participant of the session plus anyone seen in its rounds.
    static StandingsTable FromSession(const model::Session& session);

    void AddParticipant(const std::string& id, const std::string& name, bool active = true);

    // Tables without a result count for nothing; the bye table counts as a bye.
    void RecordTable(const model::Table& table);
    void RecordRound(const model::Round& round);

    const std::vector<ParticipantStats>& standings() const { return standings_; }
    // Points, then wins, then name.
    std::vector<ParticipantStats> Ranked() const;
    const ParticipantStats* Find(const std::string& id) const;
    int games_played() const { return games_played_; }

private:
    ParticipantStats& Entry(const model::Participant& participant);

    model::Settings settings_;
    std::vector<ParticipantStats> standings_;
    int games_played_ = 0;
};

}  // namespace tablepod::core::stats
