#pragma once

#include "tablepod/core/model/Table.h"

#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tablepod::core::pairing {

// Co-occurrence counts and undersized-table placements derived from the
// archived rounds. Always rebuilt from the full archive.
class PairingHistory {
public:
    using PairKey = std::pair<std::string, std::string>;

    static PairingHistory Build(const std::vector<model::Round>& archived_rounds,
                                bool extra_three_seat_penalty);

    int PairCount(const std::string& a, const std::string& b) const;
    int UndersizedCount(const std::string& participant_id) const;
    // True when the participant sat at a 3-seat table in the latest archived round.
    bool InLastUndersizedTable(const std::string& participant_id) const;

    const std::map<PairKey, int>& pair_counts() const { return pair_counts_; }
    int rounds_recorded() const { return rounds_recorded_; }

    static PairKey MakeKey(const std::string& a, const std::string& b);

private:
    void RecordRound(const model::Round& round, bool extra_three_seat_penalty, bool is_latest);

    std::map<PairKey, int> pair_counts_;
    std::unordered_map<std::string, int> undersized_counts_;
    std::unordered_set<std::string> last_round_undersized_;
    int rounds_recorded_ = 0;
};

}  // namespace tablepod::core::pairing
