#include "tablepod/core/pairing/PairingHistory.h"

#include "TestSupport.h"

#include <gtest/gtest.h>

using tablepod::core::model::Round;
using tablepod::core::model::kByeTableNumber;
using tablepod::core::pairing::PairingHistory;
using tablepod::test::MakeTable;

TEST(PairingHistoryTest, CountsAreSymmetric) {
    const std::vector<Round> archive = {{MakeTable(1, {"a", "b", "c", "d"})}};
    const auto history = PairingHistory::Build(archive, false);

    EXPECT_EQ(history.PairCount("a", "b"), 1);
    EXPECT_EQ(history.PairCount("b", "a"), 1);
    EXPECT_EQ(history.PairCount("a", "a"), 0);
    EXPECT_EQ(history.PairCount("a", "z"), 0);
    EXPECT_EQ(history.pair_counts().size(), 6u);
}

TEST(PairingHistoryTest, CountsAccumulateAcrossRounds) {
    std::vector<Round> archive = {{MakeTable(1, {"a", "b", "c", "d"})}};
    const auto before = PairingHistory::Build(archive, false);
    archive.push_back({MakeTable(1, {"a", "b", "e"}), MakeTable(2, {"c", "d", "f", "g"})});
    const auto after = PairingHistory::Build(archive, false);

    for (const auto& [key, count] : before.pair_counts()) {
        EXPECT_GE(after.PairCount(key.first, key.second), count);
    }
    EXPECT_EQ(after.PairCount("a", "b"), 2);
    EXPECT_EQ(after.rounds_recorded(), 2);
}

TEST(PairingHistoryTest, ByeTableIsIgnored) {
    const std::vector<Round> archive = {{MakeTable(kByeTableNumber, {"a", "b", "c"})}};
    const auto history = PairingHistory::Build(archive, false);

    EXPECT_EQ(history.PairCount("a", "b"), 0);
    EXPECT_EQ(history.UndersizedCount("a"), 0);
}

TEST(PairingHistoryTest, TracksThreeSeatPlacements) {
    const std::vector<Round> archive = {
        {MakeTable(1, {"a", "b", "c"}), MakeTable(2, {"d", "e", "f", "g"})},
        {MakeTable(1, {"d", "e", "f"}), MakeTable(2, {"a", "b", "c", "g"})},
    };
    const auto history = PairingHistory::Build(archive, false);

    EXPECT_EQ(history.UndersizedCount("a"), 1);
    EXPECT_EQ(history.UndersizedCount("g"), 0);
    EXPECT_FALSE(history.InLastUndersizedTable("a"));
    EXPECT_TRUE(history.InLastUndersizedTable("d"));

    const auto weighted = PairingHistory::Build(archive, true);
    EXPECT_EQ(weighted.UndersizedCount("a"), 4);
}
