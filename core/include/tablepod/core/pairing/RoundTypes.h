#pragma once

#include "tablepod/core/model/Participant.h"
#include "tablepod/core/model/Settings.h"
#include "tablepod/core/model/Table.h"

#include <vector>

namespace tablepod::core::pairing {

constexpr int kFourSeats = 4;
constexpr int kThreeSeats = 3;

struct RoundContext {
    int round_number = 0;
    bool first_round = false;
    model::Settings settings;
    std::vector<model::Participant> participants;
};

// A table under construction together with the size it must reach.
struct FillSlot {
    model::Table table;
    int target_size = kFourSeats;
    bool custom = false;
    bool winners = false;

    int open_seats() const { return target_size - table.size(); }
};

enum class FairnessMode {
    Progressive,
    Flat
};

struct SelectorOptions {
    bool score_against_pool = true;
    FairnessMode fairness = FairnessMode::Progressive;
};

}  // namespace tablepod::core::pairing
