#pragma once

#include "tablepod/core/model/Participant.h"
#include "tablepod/core/pairing/PairingHistory.h"
#include "tablepod/core/pairing/RoundTypes.h"
#include "tablepod/core/util/SecureRandom.h"

#include <vector>

namespace tablepod::core::pairing {

// Greedy weighted draw that fills seats one at a time, biased against
// repeat pairings and toward participants who sat at 3-seat tables.
class MinimalRepeatSelector {
public:
    MinimalRepeatSelector(const PairingHistory& history,
                          util::SecureRandom& random,
                          SelectorOptions options = {});

    // Picks up to count candidates. Does not modify candidates; callers
    // remove the picks from their pool (see ErasePicked).
    std::vector<model::Participant> Select(const std::vector<model::Participant>& candidates,
                                           const std::vector<model::Participant>& committed,
                                           int count) const;

    int PairingScore(const model::Participant& candidate,
                     const std::vector<model::Participant>& committed,
                     const std::vector<model::Participant>& selected,
                     const std::vector<model::Participant>& remaining) const;

    double FairnessMultiplier(const std::string& participant_id) const;

    static double ProgressiveMultiplier(int undersized_count);

    const SelectorOptions& options() const { return options_; }

private:
    size_t DrawIndex(const std::vector<model::Participant>& remaining,
                     const std::vector<int>& scores) const;

    const PairingHistory& history_;
    util::SecureRandom& random_;
    SelectorOptions options_;
};

// Removes every participant in picked from pool, matching by id.
void ErasePicked(std::vector<model::Participant>& pool, const std::vector<model::Participant>& picked);

}  // namespace tablepod::core::pairing
