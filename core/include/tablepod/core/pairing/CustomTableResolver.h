#pragma once

#include "tablepod/core/model/Participant.h"
#include "tablepod/core/model/Settings.h"
#include "tablepod/core/model/Table.h"

#include <map>
#include <string>
#include <vector>

namespace tablepod::core::pairing {

// Custom group with auto-fill on and fewer than four members. The generator
// decides its target size and the selector fills the rest.
struct OpenCustomGroup {
    std::string group_id;
    std::vector<model::Participant> members;
};

struct CustomResolution {
    // Final tables, never touched by the selector.
    std::vector<model::Table> complete_tables;
    std::vector<OpenCustomGroup> open_groups;
    // Participants outside any custom group.
    std::vector<model::Participant> pool;

    int open_member_count() const;
};

class CustomTableResolver {
public:
    // Clears custom_group_id and auto_fill on every participant that is the
    // only member of its group. Returns the number of groups dissolved.
    static int DissolveSingletonGroups(std::map<std::string, model::Participant>& participants);

    // Groups keep the order in which their first member appears in participants.
    static CustomResolution Resolve(const std::vector<model::Participant>& participants,
                                    const model::Settings& settings,
                                    int round_number);
};

}  // namespace tablepod::core::pairing
