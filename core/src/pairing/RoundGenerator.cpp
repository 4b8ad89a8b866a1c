#include "tablepod/core/pairing/RoundGenerator.h"

#include "tablepod/core/pairing/MinimalRepeatSelector.h"
#include "tablepod/core/pairing/PairingHistory.h"
#include "tablepod/core/pairing/WinnerPriorityAssembler.h"

#include <numeric>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace tablepod::core::pairing {

namespace {

bool HoldsWinnerOf(const model::Table& table, const std::unordered_set<std::string>& winner_ids) {
    for (const auto& seat : table.seats) {
        if (winner_ids.count(seat.id) > 0) {
            return true;
        }
    }
    return false;
}

}  // namespace

RoundGenerator::RoundGenerator(util::SecureRandom& random,
                               SelectorOptions options,
                               std::function<void(const std::string&)> log_fn)
    : random_(random), options_(options), log_fn_(std::move(log_fn)) {}

model::Round RoundGenerator::BuildRound(const RoundContext& context,
                                        const std::vector<model::Round>& archive) const {
    const auto& settings = context.settings;
    const auto history = PairingHistory::Build(archive, settings.extra_three_seat_penalty);
    const MinimalRepeatSelector selector(history, random_, options_);

    auto resolution = CustomTableResolver::Resolve(context.participants, settings, context.round_number);
    const int seat_count = static_cast<int>(resolution.pool.size()) + resolution.open_member_count();
    const bool three_seat_cap = settings.max_table_size == kThreeSeats;
    const auto plan = three_seat_cap ? TablePlanner::PlanThreesOnly(seat_count)
                                     : TablePlanner::Plan(seat_count, settings.allow_three_seat_tables);

    auto slots = PlanSlots(plan, resolution, context.round_number,
                           settings.allow_three_seat_tables || three_seat_cap);
    random_.Shuffle(slots);

    auto& pool = resolution.pool;
    const model::Round* last_round = archive.empty() ? nullptr : &archive.back();
    if (settings.prioritize_winners && !context.first_round && last_round != nullptr) {
        auto winners = WinnerPriorityAssembler::CollectWinners(*last_round, pool);
        if (!winners.empty()) {
            const WinnerPriorityAssembler assembler(selector, random_);
            const auto leftover = assembler.Assemble(std::move(winners), slots, pool);
            pool.insert(pool.end(), leftover.begin(), leftover.end());
        }
    }

    random_.Shuffle(pool);
    for (auto& slot : slots) {
        while (slot.open_seats() > 0 && !pool.empty()) {
            const auto picked = selector.Select(pool, slot.table.seats, 1);
            if (picked.empty()) {
                break;
            }
            slot.table.AddSeat(picked.front());
            ErasePicked(pool, picked);
        }
    }

    for (const auto& slot : slots) {
        if (slot.table.size() != slot.target_size) {
            std::ostringstream message;
            message << "table filled to " << slot.table.size() << " seats, planned " << slot.target_size
                    << " (round " << context.round_number << ", " << seat_count << " seats to place, "
                    << pool.size() << " unplaced)";
            throw std::logic_error(message.str());
        }
    }

    model::Round tables = std::move(resolution.complete_tables);
    for (auto& slot : slots) {
        tables.push_back(std::move(slot.table));
    }

    if (!pool.empty()) {
        model::Table bye;
        bye.number = model::kByeTableNumber;
        bye.round_number = context.round_number;
        for (const auto& participant : pool) {
            bye.AddSeat(participant);
        }
        tables.push_back(std::move(bye));
    }

    RelabelTables(tables, last_round);

    std::ostringstream summary;
    summary << "round " << context.round_number << ": " << plan.fours << "x4 " << plan.threes << "x3, "
            << tables.size() << " tables, " << pool.size() << " on bye";
    Log(summary.str());
    return tables;
}

void RoundGenerator::RelabelTables(model::Round& tables, const model::Round* last_round) const {
    std::unordered_set<std::string> winner_ids;
    if (last_round != nullptr) {
        for (const auto& table : *last_round) {
            if (table.result == model::ResultKind::Win && !table.winner_id.empty()) {
                winner_ids.insert(table.winner_id);
            }
        }
    }

    model::Round winner_tables;
    model::Round regular_tables;
    model::Round custom_tables;
    model::Round bye_tables;
    for (auto& table : tables) {
        if (table.is_bye()) {
            bye_tables.push_back(std::move(table));
        } else if (HoldsWinnerOf(table, winner_ids)) {
            winner_tables.push_back(std::move(table));
        } else if (table.is_custom) {
            custom_tables.push_back(std::move(table));
        } else {
            regular_tables.push_back(std::move(table));
        }
    }

    random_.Shuffle(winner_tables);
    random_.Shuffle(regular_tables);
    random_.Shuffle(custom_tables);

    tables.clear();
    int number = 1;
    for (auto* group : {&winner_tables, &regular_tables, &custom_tables}) {
        for (auto& table : *group) {
            table.number = number++;
            AssignSeatOrder(table);
            tables.push_back(std::move(table));
        }
    }
    for (auto& table : bye_tables) {
        table.number = model::kByeTableNumber;
        tables.push_back(std::move(table));
    }
}

std::vector<FillSlot> RoundGenerator::PlanSlots(const TablePlan& plan,
                                                CustomResolution& resolution,
                                                int round_number,
                                                bool allow_three_seat_tables) const {
    int fours = plan.fours;
    int threes = plan.threes;
    std::vector<FillSlot> slots;

    for (auto& group : resolution.open_groups) {
        int target = 0;
        if (fours > 0 && threes > 0 && allow_three_seat_tables) {
            target = random_.CoinFlip() ? kFourSeats : kThreeSeats;
        } else if (fours > 0) {
            target = kFourSeats;
        } else if (threes > 0 && allow_three_seat_tables) {
            target = kThreeSeats;
        }

        if (target == 0) {
            // No table left in the plan: the group joins the general pool.
            Log("custom group " + group.group_id + " has no table this round, seating members individually");
            resolution.pool.insert(resolution.pool.end(), group.members.begin(), group.members.end());
            continue;
        }
        if (target == kFourSeats) {
            --fours;
        } else {
            --threes;
        }

        FillSlot slot;
        slot.target_size = target;
        slot.custom = true;
        slot.table.round_number = round_number;
        slot.table.is_custom = true;
        slot.table.auto_fill = true;
        for (const auto& member : group.members) {
            slot.table.AddSeat(member);
        }
        slots.push_back(std::move(slot));
    }

    const auto add_regular = [&](int count, int size) {
        for (int i = 0; i < count; ++i) {
            FillSlot slot;
            slot.target_size = size;
            slot.table.round_number = round_number;
            slots.push_back(std::move(slot));
        }
    };
    add_regular(fours, kFourSeats);
    add_regular(threes, kThreeSeats);
    return slots;
}

void RoundGenerator::AssignSeatOrder(model::Table& table) const {
    std::vector<int> orders(table.seats.size());
    std::iota(orders.begin(), orders.end(), 1);
    random_.Shuffle(orders);
    for (size_t i = 0; i < table.seats.size(); ++i) {
        table.seats[i].order = orders[i];
    }
}

void RoundGenerator::Log(const std::string& message) const {
    if (log_fn_) {
        log_fn_("[generator] " + message);
    }
}

}  // namespace tablepod::core::pairing
