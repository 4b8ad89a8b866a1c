#include "tablepod/core/pairing/MinimalRepeatSelector.h"

#include "TestSupport.h"

#include <gtest/gtest.h>

#include <set>

using tablepod::core::model::Participant;
using tablepod::core::model::Round;
using tablepod::core::pairing::ErasePicked;
using tablepod::core::pairing::FairnessMode;
using tablepod::core::pairing::MinimalRepeatSelector;
using tablepod::core::pairing::PairingHistory;
using tablepod::core::pairing::SelectorOptions;
using tablepod::core::util::SecureRandom;
using tablepod::test::MakeParticipant;
using tablepod::test::MakeParticipants;
using tablepod::test::MakeTable;

TEST(MinimalRepeatSelectorTest, ProgressiveMultiplierDoublesAndCaps) {
    EXPECT_DOUBLE_EQ(MinimalRepeatSelector::ProgressiveMultiplier(0), 1.0);
    EXPECT_DOUBLE_EQ(MinimalRepeatSelector::ProgressiveMultiplier(1), 2.0);
    EXPECT_DOUBLE_EQ(MinimalRepeatSelector::ProgressiveMultiplier(2), 4.0);
    EXPECT_DOUBLE_EQ(MinimalRepeatSelector::ProgressiveMultiplier(4), 16.0);
    EXPECT_DOUBLE_EQ(MinimalRepeatSelector::ProgressiveMultiplier(5), 32.0);
    EXPECT_DOUBLE_EQ(MinimalRepeatSelector::ProgressiveMultiplier(12), 32.0);
}

TEST(MinimalRepeatSelectorTest, FlatFairnessOnlyLooksAtLastRound) {
    const std::vector<Round> archive = {
        {MakeTable(1, {"a", "b", "c"})},
        {MakeTable(1, {"d", "e", "f"})},
    };
    const auto history = PairingHistory::Build(archive, false);
    SecureRandom random;
    SelectorOptions options;
    options.fairness = FairnessMode::Flat;
    const MinimalRepeatSelector selector(history, random, options);

    EXPECT_DOUBLE_EQ(selector.FairnessMultiplier("a"), 1.0);
    EXPECT_DOUBLE_EQ(selector.FairnessMultiplier("d"), 3.0);
}

TEST(MinimalRepeatSelectorTest, SelectReturnsDistinctCandidates) {
    const PairingHistory history;
    SecureRandom random;
    const MinimalRepeatSelector selector(history, random);
    const auto candidates = MakeParticipants(10);

    for (int attempt = 0; attempt < 20; ++attempt) {
        const auto picked = selector.Select(candidates, {}, 4);
        ASSERT_EQ(picked.size(), 4u);
        std::set<std::string> ids;
        for (const auto& participant : picked) {
            ids.insert(participant.id);
        }
        EXPECT_EQ(ids.size(), 4u);
    }
    EXPECT_EQ(candidates.size(), 10u);
}

TEST(MinimalRepeatSelectorTest, SelectStopsWhenCandidatesRunOut) {
    const PairingHistory history;
    SecureRandom random;
    const MinimalRepeatSelector selector(history, random);

    EXPECT_EQ(selector.Select(MakeParticipants(2), {}, 4).size(), 2u);
    EXPECT_TRUE(selector.Select({}, {}, 3).empty());
}

TEST(MinimalRepeatSelectorTest, AvoidsRepeatOpponentsWhenPossible) {
    // a and b shared many tables; c never met a.
    std::vector<Round> archive;
    for (int i = 0; i < 12; ++i) {
        archive.push_back({MakeTable(1, {"a", "b", "x", "y"})});
    }
    const auto history = PairingHistory::Build(archive, false);
    SecureRandom random;
    SelectorOptions options;
    options.score_against_pool = false;
    const MinimalRepeatSelector selector(history, random, options);

    const std::vector<Participant> committed = {MakeParticipant("a")};
    const std::vector<Participant> candidates = {MakeParticipant("b"), MakeParticipant("c")};
    int picked_c = 0;
    for (int attempt = 0; attempt < 50; ++attempt) {
        const auto picked = selector.Select(candidates, committed, 1);
        ASSERT_EQ(picked.size(), 1u);
        if (picked.front().id == "c") {
            ++picked_c;
        }
    }
    EXPECT_GT(picked_c, 40);
}

TEST(MinimalRepeatSelectorTest, ErasePickedMatchesById) {
    auto pool = MakeParticipants(5);
    ErasePicked(pool, {MakeParticipant("p2"), MakeParticipant("p4"), MakeParticipant("zz")});

    ASSERT_EQ(pool.size(), 3u);
    EXPECT_EQ(pool[0].id, "p1");
    EXPECT_EQ(pool[1].id, "p3");
    EXPECT_EQ(pool[2].id, "p5");
}
