#pragma once

#include "tablepod/core/model/Participant.h"
#include "tablepod/core/util/Timestamp.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tablepod::core::model {

constexpr int kByeTableNumber = 99;

enum class ResultKind {
    None,
    Win,
    Draw
};

enum class TableState {
    Forming,
    InProgress,
    Completed
};

struct Table {
    int number = 0;
    int round_number = 0;
    std::vector<Participant> seats;
    ResultKind result = ResultKind::None;
    std::string winner_id;
    std::optional<util::TimePoint> started_at;
    std::optional<util::TimePoint> completed_at;
    bool round_started = false;
    nlohmann::json statistics = nlohmann::json::object();
    bool is_custom = false;
    bool auto_fill = false;

    bool has_result() const { return result != ResultKind::None; }
    bool is_bye() const { return number == kByeTableNumber; }
    int size() const { return static_cast<int>(seats.size()); }
    TableState state() const;

    bool Contains(const std::string& participant_id) const;
    Participant* Find(const std::string& participant_id);
    const Participant* Find(const std::string& participant_id) const;

    // Returns false when the participant is already seated.
    bool AddSeat(const Participant& participant);
    bool RemoveSeat(const std::string& participant_id);

    void SetWinner(const std::string& participant_id);
    void SetDraw();
    void ClearResult();
};

using Round = std::vector<Table>;

const char* ToString(ResultKind kind);
bool ResultKindFromString(const std::string& text, ResultKind& kind);
const char* ToString(TableState state);

}  // namespace tablepod::core::model
