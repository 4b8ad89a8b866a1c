#pragma once

#include "tablepod/core/model/Table.h"
#include "tablepod/core/pairing/CustomTableResolver.h"
#include "tablepod/core/pairing/RoundTypes.h"
#include "tablepod/core/pairing/TablePlanner.h"
#include "tablepod/core/util/SecureRandom.h"

#include <functional>
#include <string>
#include <vector>

namespace tablepod::core::pairing {

// Builds one round of tables from the active participants and the archive.
// Pure with respect to its inputs: the caller commits the returned round.
class RoundGenerator {
public:
    RoundGenerator(util::SecureRandom& random,
                   SelectorOptions options = {},
                   std::function<void(const std::string&)> log_fn = {});

    // Throws std::logic_error when a filled table does not reach its planned size.
    model::Round BuildRound(const RoundContext& context, const std::vector<model::Round>& archive) const;

    // Numbers tables from 1: tables holding a winner of last_round first, then
    // regular, then custom, each group shuffled. The bye table keeps 99 and
    // goes last. Seat orders are reshuffled.
    void RelabelTables(model::Round& tables, const model::Round* last_round) const;

private:
    std::vector<FillSlot> PlanSlots(const TablePlan& plan,
                                    CustomResolution& resolution,
                                    int round_number,
                                    bool allow_three_seat_tables) const;
    void AssignSeatOrder(model::Table& table) const;
    void Log(const std::string& message) const;

    util::SecureRandom& random_;
    SelectorOptions options_;
    std::function<void(const std::string&)> log_fn_;
};

}  // namespace tablepod::core::pairing
