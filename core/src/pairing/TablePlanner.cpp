#include "tablepod/core/pairing/TablePlanner.h"

namespace tablepod::core::pairing {

namespace {

// Pools under six only reach the planner after custom tables were carved out.
TablePlan PlanSmallPool(int participant_count) {
    TablePlan plan;
    switch (participant_count) {
        case 3:
            plan.threes = 1;
            break;
        case 4:
            plan.fours = 1;
            break;
        case 5:
            plan.fours = 1;
            plan.excluded = 1;
            break;
        default:
            plan.excluded = participant_count > 0 ? participant_count : 0;
            break;
    }
    return plan;
}

}  // namespace

TablePlan TablePlanner::Plan(int participant_count, bool allow_three_seat_tables) {
    TablePlan plan;
    if (participant_count <= 0) {
        return plan;
    }

    const int k = participant_count / 4;
    const int r = participant_count % 4;

    if (!allow_three_seat_tables) {
        plan.fours = k;
        plan.excluded = r;
        return plan;
    }

    if (participant_count < 6) {
        return PlanSmallPool(participant_count);
    }

    plan.fours = k;
    switch (r) {
        case 1:
            plan.fours = k - 2;
            plan.threes = 3;
            break;
        case 2:
            plan.fours = k - 1;
            plan.threes = 2;
            break;
        case 3:
            plan.threes = 1;
            break;
        default:
            break;
    }
    return plan;
}

TablePlan TablePlanner::PlanThreesOnly(int participant_count) {
    TablePlan plan;
    if (participant_count <= 0) {
        return plan;
    }
    plan.threes = participant_count / 3;
    plan.excluded = participant_count % 3;
    return plan;
}

}  // namespace tablepod::core::pairing
