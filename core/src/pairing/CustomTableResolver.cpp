#include "tablepod/core/pairing/CustomTableResolver.h"

#include "tablepod/core/pairing/RoundTypes.h"

#include <unordered_map>

namespace tablepod::core::pairing {

namespace {

struct GroupMembers {
    std::string group_id;
    bool auto_fill = false;
    std::vector<model::Participant> members;
};

}  // namespace

int CustomResolution::open_member_count() const {
    int count = 0;
    for (const auto& group : open_groups) {
        count += static_cast<int>(group.members.size());
    }
    return count;
}

int CustomTableResolver::DissolveSingletonGroups(std::map<std::string, model::Participant>& participants) {
    std::unordered_map<std::string, int> sizes;
    for (const auto& [id, participant] : participants) {
        if (participant.in_custom_group()) {
            sizes[participant.custom_group_id] += 1;
        }
    }

    int dissolved = 0;
    for (auto& [id, participant] : participants) {
        if (!participant.in_custom_group()) {
            continue;
        }
        if (sizes[participant.custom_group_id] == 1) {
            participant.custom_group_id.clear();
            participant.auto_fill = false;
            ++dissolved;
        }
    }
    return dissolved;
}

CustomResolution CustomTableResolver::Resolve(const std::vector<model::Participant>& participants,
                                              const model::Settings& settings,
                                              int round_number) {
    CustomResolution resolution;
    if (!settings.allow_custom_groups) {
        resolution.pool = participants;
        return resolution;
    }

    std::vector<GroupMembers> groups;
    std::unordered_map<std::string, size_t> index_by_id;
    for (const auto& participant : participants) {
        if (!participant.in_custom_group()) {
            resolution.pool.push_back(participant);
            continue;
        }
        auto it = index_by_id.find(participant.custom_group_id);
        if (it == index_by_id.end()) {
            GroupMembers group;
            group.group_id = participant.custom_group_id;
            group.auto_fill = participant.auto_fill;
            it = index_by_id.emplace(participant.custom_group_id, groups.size()).first;
            groups.push_back(std::move(group));
        }
        groups[it->second].members.push_back(participant);
    }

    for (auto& group : groups) {
        if (static_cast<int>(group.members.size()) >= kFourSeats || !group.auto_fill) {
            model::Table table;
            table.round_number = round_number;
            table.is_custom = true;
            table.auto_fill = false;
            for (const auto& member : group.members) {
                table.AddSeat(member);
            }
            resolution.complete_tables.push_back(std::move(table));
            continue;
        }

        OpenCustomGroup open;
        open.group_id = group.group_id;
        open.members = std::move(group.members);
        resolution.open_groups.push_back(std::move(open));
    }
    return resolution;
}

}  // namespace tablepod::core::pairing
