#include "tablepod/core/pairing/PairingHistory.h"

#include "tablepod/core/pairing/RoundTypes.h"

#include <algorithm>

namespace tablepod::core::pairing {

namespace {

constexpr int kExtraThreeSeatPenalty = 3;

}  // namespace

PairingHistory PairingHistory::Build(const std::vector<model::Round>& archived_rounds,
                                     bool extra_three_seat_penalty) {
    PairingHistory history;
    for (size_t i = 0; i < archived_rounds.size(); ++i) {
        const bool is_latest = (i + 1 == archived_rounds.size());
        history.RecordRound(archived_rounds[i], extra_three_seat_penalty, is_latest);
    }
    return history;
}

PairingHistory::PairKey PairingHistory::MakeKey(const std::string& a, const std::string& b) {
    if (a.compare(b) < 0) {
        return {a, b};
    }
    return {b, a};
}

int PairingHistory::PairCount(const std::string& a, const std::string& b) const {
    if (a == b) {
        return 0;
    }
    const auto it = pair_counts_.find(MakeKey(a, b));
    return it == pair_counts_.end() ? 0 : it->second;
}

int PairingHistory::UndersizedCount(const std::string& participant_id) const {
    const auto it = undersized_counts_.find(participant_id);
    return it == undersized_counts_.end() ? 0 : it->second;
}

bool PairingHistory::InLastUndersizedTable(const std::string& participant_id) const {
    return last_round_undersized_.count(participant_id) > 0;
}

void PairingHistory::RecordRound(const model::Round& round, bool extra_three_seat_penalty, bool is_latest) {
    ++rounds_recorded_;
    for (const auto& table : round) {
        // Bye seats never shared a game.
        if (table.is_bye()) {
            continue;
        }

        std::vector<std::string> ids;
        ids.reserve(table.seats.size());
        for (const auto& seat : table.seats) {
            ids.push_back(seat.id);
        }
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

        for (size_t i = 0; i < ids.size(); ++i) {
            for (size_t j = i + 1; j < ids.size(); ++j) {
                pair_counts_[{ids[i], ids[j]}] += 1;
            }
        }

        if (static_cast<int>(ids.size()) == kThreeSeats) {
            for (const auto& id : ids) {
                undersized_counts_[id] += 1;
                if (extra_three_seat_penalty) {
                    undersized_counts_[id] += kExtraThreeSeatPenalty;
                }
                if (is_latest) {
                    last_round_undersized_.insert(id);
                }
            }
        }
    }
}

}  // namespace tablepod::core::pairing
