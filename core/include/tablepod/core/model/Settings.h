#pragma once

namespace tablepod::core::model {

struct Settings {
    bool allow_join_after_start = true;
    bool prioritize_winners = true;
    bool allow_three_seat_tables = true;
    // Each 3-seat placement weighs 4 instead of 1 in the fairness history.
    bool extra_three_seat_penalty = false;
    bool allow_custom_groups = true;
    int round_length_minutes = 90;

    bool use_points = false;
    int points_for_win = 3;
    int points_for_draw = 1;
    int points_for_loss = 0;
    int points_for_bye = 1;

    // 0 means unlimited.
    int max_rounds = 0;
    // Largest table a host may build by hand (custom group or move). At 3
    // the generator also plans 3-seat tables only.
    int max_table_size = 4;
};

}  // namespace tablepod::core::model
