#pragma once

#include "tablepod/core/util/Timestamp.h"

#include <string>

namespace tablepod::core::model {

struct Participant {
    std::string id;
    std::string name;
    // Character/commander played this round; may change between rounds.
    std::string role;
    int points = 0;
    util::TimePoint joined_at{};
    bool dropped = false;
    // Seat order within the current table, 1-based. 0 until seated.
    int order = 0;
    std::string custom_group_id;
    bool auto_fill = false;

    bool in_custom_group() const { return !custom_group_id.empty(); }
};

}  // namespace tablepod::core::model
