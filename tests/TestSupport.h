#pragma once

#include "tablepod/core/model/Participant.h"
#include "tablepod/core/model/Session.h"
#include "tablepod/core/model/Table.h"
#include "tablepod/core/util/Timestamp.h"

#include <chrono>
#include <initializer_list>
#include <set>
#include <string>
#include <vector>

namespace tablepod::test {

inline core::model::Participant MakeParticipant(const std::string& id) {
    core::model::Participant participant;
    participant.id = id;
    participant.name = "Player " + id;
    return participant;
}

inline std::vector<core::model::Participant> MakeParticipants(int count) {
    std::vector<core::model::Participant> participants;
    for (int i = 1; i <= count; ++i) {
        participants.push_back(MakeParticipant("p" + std::to_string(i)));
    }
    return participants;
}

inline core::model::Table MakeTable(int number, std::initializer_list<const char*> ids) {
    core::model::Table table;
    table.number = number;
    int order = 1;
    for (const auto* id : ids) {
        auto participant = MakeParticipant(id);
        participant.order = order++;
        table.AddSeat(participant);
    }
    return table;
}

// Session with count participants p1..pN that expires in a day.
inline core::model::Session MakeSession(int count, const std::string& code = "ROOM42") {
    core::model::Session session;
    session.code = code;
    session.host_id = "host";
    session.created_at = core::util::Clock::now();
    session.expires_at = session.created_at + std::chrono::hours(24);
    for (const auto& participant : MakeParticipants(count)) {
        session.participants.emplace(participant.id, participant);
    }
    return session;
}

inline std::vector<std::string> SeatedIds(const core::model::Round& round) {
    std::vector<std::string> ids;
    for (const auto& table : round) {
        for (const auto& seat : table.seats) {
            ids.push_back(seat.id);
        }
    }
    return ids;
}

inline bool HasNoDuplicates(const core::model::Round& round) {
    const auto ids = SeatedIds(round);
    const std::set<std::string> unique(ids.begin(), ids.end());
    return unique.size() == ids.size();
}

}  // namespace tablepod::test
