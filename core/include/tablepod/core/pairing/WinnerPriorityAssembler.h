#pragma once

#include "tablepod/core/model/Participant.h"
#include "tablepod/core/model/Table.h"
#include "tablepod/core/pairing/MinimalRepeatSelector.h"
#include "tablepod/core/pairing/RoundTypes.h"
#include "tablepod/core/util/SecureRandom.h"

#include <vector>

namespace tablepod::core::pairing {

// Seats the previous round's winners together before the general fill.
class WinnerPriorityAssembler {
public:
    WinnerPriorityAssembler(const MinimalRepeatSelector& selector, util::SecureRandom& random);

    // Moves the winners of last_round that are still in pool out of pool.
    // Returns them in last_round table order.
    static std::vector<model::Participant> CollectWinners(const model::Round& last_round,
                                                          std::vector<model::Participant>& pool);

    // Places full winner tables into empty 4-seat slots, then tries to
    // complete one more table of 4 from the remainder by borrowing from
    // regular. Borrowed participants are removed from regular. Returns the
    // winners that could not be seated; callers put them back in the pool.
    std::vector<model::Participant> Assemble(std::vector<model::Participant> winners,
                                             std::vector<FillSlot>& slots,
                                             std::vector<model::Participant>& regular) const;

private:
    FillSlot* FindRemainderSlot(std::vector<FillSlot>& slots, int winner_count) const;

    const MinimalRepeatSelector& selector_;
    util::SecureRandom& random_;
};

}  // namespace tablepod::core::pairing
