#include "tablepod/core/model/Table.h"

#include <algorithm>

namespace tablepod::core::model {

TableState Table::state() const {
    if (has_result()) {
        return TableState::Completed;
    }
    return round_started ? TableState::InProgress : TableState::Forming;
}

bool Table::Contains(const std::string& participant_id) const {
    return Find(participant_id) != nullptr;
}

Participant* Table::Find(const std::string& participant_id) {
    for (auto& seat : seats) {
        if (seat.id == participant_id) {
            return &seat;
        }
    }
    return nullptr;
}

const Participant* Table::Find(const std::string& participant_id) const {
    for (const auto& seat : seats) {
        if (seat.id == participant_id) {
            return &seat;
        }
    }
    return nullptr;
}

bool Table::AddSeat(const Participant& participant) {
    if (Contains(participant.id)) {
        return false;
    }
    seats.push_back(participant);
    return true;
}

bool Table::RemoveSeat(const std::string& participant_id) {
    const auto it = std::find_if(seats.begin(), seats.end(), [&](const Participant& seat) {
        return seat.id == participant_id;
    });
    if (it == seats.end()) {
        return false;
    }
    seats.erase(it);
    return true;
}

void Table::SetWinner(const std::string& participant_id) {
    result = ResultKind::Win;
    winner_id = participant_id;
}

void Table::SetDraw() {
    result = ResultKind::Draw;
    winner_id.clear();
}

void Table::ClearResult() {
    result = ResultKind::None;
    winner_id.clear();
}

const char* ToString(ResultKind kind) {
    switch (kind) {
        case ResultKind::Win:
            return "win";
        case ResultKind::Draw:
            return "draw";
        case ResultKind::None:
            break;
    }
    return "none";
}

bool ResultKindFromString(const std::string& text, ResultKind& kind) {
    if (text == "win") {
        kind = ResultKind::Win;
    } else if (text == "draw") {
        kind = ResultKind::Draw;
    } else if (text == "none" || text.empty()) {
        kind = ResultKind::None;
    } else {
        return false;
    }
    return true;
}

const char* ToString(TableState state) {
    switch (state) {
        case TableState::InProgress:
            return "in_progress";
        case TableState::Completed:
            return "completed";
        case TableState::Forming:
            break;
    }
    return "forming";
}

}  // namespace tablepod::core::model
