#include "tablepod/core/pairing/CustomTableResolver.h"

#include "TestSupport.h"

#include <gtest/gtest.h>

#include <map>

using tablepod::core::model::Participant;
using tablepod::core::model::Settings;
using tablepod::core::pairing::CustomTableResolver;
using tablepod::test::MakeParticipants;

namespace {

void Group(std::vector<Participant>& participants, const std::vector<int>& indexes, const std::string& group_id,
           bool auto_fill) {
    for (const int index : indexes) {
        participants[static_cast<size_t>(index)].custom_group_id = group_id;
        participants[static_cast<size_t>(index)].auto_fill = auto_fill;
    }
}

}  // namespace

TEST(CustomTableResolverTest, SplitsCompleteAndOpenGroups) {
    auto participants = MakeParticipants(12);
    Group(participants, {0, 1, 2, 3}, "full", true);
    Group(participants, {4, 5}, "open", true);
    Group(participants, {6, 7, 8}, "closed", false);

    const auto resolution = CustomTableResolver::Resolve(participants, Settings{}, 2);

    ASSERT_EQ(resolution.complete_tables.size(), 2u);
    EXPECT_EQ(resolution.complete_tables[0].size(), 4);
    EXPECT_EQ(resolution.complete_tables[1].size(), 3);
    EXPECT_TRUE(resolution.complete_tables[0].is_custom);
    EXPECT_FALSE(resolution.complete_tables[1].auto_fill);
    EXPECT_EQ(resolution.complete_tables[0].round_number, 2);

    ASSERT_EQ(resolution.open_groups.size(), 1u);
    EXPECT_EQ(resolution.open_groups[0].group_id, "open");
    EXPECT_EQ(resolution.open_member_count(), 2);
    EXPECT_EQ(resolution.pool.size(), 3u);
}

TEST(CustomTableResolverTest, DisabledGroupsGoToPool) {
    auto participants = MakeParticipants(6);
    Group(participants, {0, 1}, "g", true);
    Settings settings;
    settings.allow_custom_groups = false;

    const auto resolution = CustomTableResolver::Resolve(participants, settings, 1);

    EXPECT_TRUE(resolution.complete_tables.empty());
    EXPECT_TRUE(resolution.open_groups.empty());
    EXPECT_EQ(resolution.pool.size(), 6u);
}

TEST(CustomTableResolverTest, DissolvesSingletonGroups) {
    std::map<std::string, Participant> participants;
    for (auto& participant : MakeParticipants(4)) {
        participants.emplace(participant.id, participant);
    }
    participants["p1"].custom_group_id = "solo";
    participants["p1"].auto_fill = true;
    participants["p2"].custom_group_id = "pair";
    participants["p3"].custom_group_id = "pair";

    EXPECT_EQ(CustomTableResolver::DissolveSingletonGroups(participants), 1);
    EXPECT_FALSE(participants["p1"].in_custom_group());
    EXPECT_FALSE(participants["p1"].auto_fill);
    EXPECT_EQ(participants["p2"].custom_group_id, "pair");
    EXPECT_EQ(CustomTableResolver::DissolveSingletonGroups(participants), 0);
}
