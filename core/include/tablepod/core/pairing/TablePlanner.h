#pragma once

namespace tablepod::core::pairing {

struct TablePlan {
    int fours = 0;
    int threes = 0;
    // Participants that cannot be seated and go to the bye table.
    int excluded = 0;

    int tables() const { return fours + threes; }
    int seats() const { return fours * 4 + threes * 3; }
};

class TablePlanner {
public:
    static TablePlan Plan(int participant_count, bool allow_three_seat_tables);
    // Rooms capped at three seats: only 3-seat tables, the remainder sits out.
    static TablePlan PlanThreesOnly(int participant_count);
};

}  // namespace tablepod::core::pairing
