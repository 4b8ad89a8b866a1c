#include "tablepod/core/pairing/WinnerPriorityAssembler.h"

#include <algorithm>
#include <unordered_set>

namespace tablepod::core::pairing {

namespace {

bool IsEmptyRegularFour(const FillSlot& slot) {
    return !slot.custom && !slot.winners && slot.target_size == kFourSeats && slot.table.seats.empty();
}

}  // namespace

WinnerPriorityAssembler::WinnerPriorityAssembler(const MinimalRepeatSelector& selector,
                                                 util::SecureRandom& random)
    : selector_(selector), random_(random) {}

std::vector<model::Participant> WinnerPriorityAssembler::CollectWinners(
    const model::Round& last_round,
    std::vector<model::Participant>& pool) {
    std::vector<model::Participant> winners;
    std::unordered_set<std::string> seen;
    for (const auto& table : last_round) {
        if (table.result != model::ResultKind::Win || table.winner_id.empty()) {
            continue;
        }
        if (!seen.insert(table.winner_id).second) {
            continue;
        }
        const auto it = std::find_if(pool.begin(), pool.end(), [&](const model::Participant& participant) {
            return participant.id == table.winner_id;
        });
        if (it == pool.end()) {
            continue;
        }
        winners.push_back(*it);
        pool.erase(it);
    }
    return winners;
}

std::vector<model::Participant> WinnerPriorityAssembler::Assemble(std::vector<model::Participant> winners,
                                                                  std::vector<FillSlot>& slots,
                                                                  std::vector<model::Participant>& regular) const {
    std::vector<model::Participant> leftover;
    if (winners.empty()) {
        return leftover;
    }

    random_.Shuffle(winners);

    const size_t full_tables = winners.size() / kFourSeats;
    for (size_t i = 0; i < full_tables; ++i) {
        const auto first = winners.begin() + static_cast<std::ptrdiff_t>(i * kFourSeats);
        std::vector<model::Participant> chunk(first, first + kFourSeats);

        const auto slot = std::find_if(slots.begin(), slots.end(), IsEmptyRegularFour);
        if (slot == slots.end()) {
            leftover.insert(leftover.end(), chunk.begin(), chunk.end());
            continue;
        }
        random_.Shuffle(chunk);
        slot->winners = true;
        for (const auto& winner : chunk) {
            slot->table.AddSeat(winner);
        }
    }

    std::vector<model::Participant> remainder(winners.begin() + static_cast<std::ptrdiff_t>(full_tables * kFourSeats),
                                              winners.end());
    if (remainder.empty()) {
        return leftover;
    }

    FillSlot* target = FindRemainderSlot(slots, static_cast<int>(remainder.size()));
    if (target == nullptr) {
        leftover.insert(leftover.end(), remainder.begin(), remainder.end());
        return leftover;
    }

    const int needed = kFourSeats - target->table.size() - static_cast<int>(remainder.size());
    std::vector<model::Participant> committed = target->table.seats;
    committed.insert(committed.end(), remainder.begin(), remainder.end());
    const auto borrowed = selector_.Select(regular, committed, needed);
    if (static_cast<int>(borrowed.size()) < needed) {
        leftover.insert(leftover.end(), remainder.begin(), remainder.end());
        return leftover;
    }

    ErasePicked(regular, borrowed);
    std::vector<model::Participant> seated = remainder;
    seated.insert(seated.end(), borrowed.begin(), borrowed.end());
    random_.Shuffle(seated);
    target->winners = true;
    for (const auto& participant : seated) {
        target->table.AddSeat(participant);
    }
    return leftover;
}

FillSlot* WinnerPriorityAssembler::FindRemainderSlot(std::vector<FillSlot>& slots, int winner_count) const {
    FillSlot* empty_slot = nullptr;
    for (auto& slot : slots) {
        if (slot.winners || slot.target_size != kFourSeats) {
            continue;
        }
        if (slot.table.size() + winner_count > kFourSeats) {
            continue;
        }
        // Open custom groups with room take precedence over fresh tables.
        if (slot.custom) {
            return &slot;
        }
        if (empty_slot == nullptr && slot.table.seats.empty()) {
            empty_slot = &slot;
        }
    }
    return empty_slot;
}

}  // namespace tablepod::core::pairing
