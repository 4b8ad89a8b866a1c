#include "tablepod/core/pairing/MinimalRepeatSelector.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace tablepod::core::pairing {

namespace {

constexpr double kFlatUndersizedBonus = 3.0;

}  // namespace

MinimalRepeatSelector::MinimalRepeatSelector(const PairingHistory& history,
                                             util::SecureRandom& random,
                                             SelectorOptions options)
    : history_(history), random_(random), options_(options) {}

std::vector<model::Participant> MinimalRepeatSelector::Select(
    const std::vector<model::Participant>& candidates,
    const std::vector<model::Participant>& committed,
    int count) const {
    std::vector<model::Participant> selected;
    if (count <= 0) {
        return selected;
    }
    selected.reserve(static_cast<size_t>(count));

    std::vector<model::Participant> remaining = candidates;
    while (static_cast<int>(selected.size()) < count && !remaining.empty()) {
        std::vector<int> scores;
        scores.reserve(remaining.size());
        for (const auto& candidate : remaining) {
            scores.push_back(PairingScore(candidate, committed, selected, remaining));
        }

        const size_t index = DrawIndex(remaining, scores);
        selected.push_back(remaining[index]);
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(index));
    }
    return selected;
}

int MinimalRepeatSelector::PairingScore(const model::Participant& candidate,
                                        const std::vector<model::Participant>& committed,
                                        const std::vector<model::Participant>& selected,
                                        const std::vector<model::Participant>& remaining) const {
    int score = 0;
    for (const auto& member : committed) {
        score += history_.PairCount(candidate.id, member.id);
    }
    for (const auto& member : selected) {
        score += history_.PairCount(candidate.id, member.id);
    }
    if (options_.score_against_pool) {
        for (const auto& other : remaining) {
            if (other.id == candidate.id) {
                continue;
            }
            score += history_.PairCount(candidate.id, other.id);
        }
    }
    return score;
}

double MinimalRepeatSelector::FairnessMultiplier(const std::string& participant_id) const {
    if (options_.fairness == FairnessMode::Flat) {
        return history_.InLastUndersizedTable(participant_id) ? kFlatUndersizedBonus : 1.0;
    }
    return ProgressiveMultiplier(history_.UndersizedCount(participant_id));
}

double MinimalRepeatSelector::ProgressiveMultiplier(int undersized_count) {
    if (undersized_count <= 0) {
        return 1.0;
    }
    if (undersized_count >= 5) {
        return 32.0;
    }
    return static_cast<double>(1 << undersized_count);
}

size_t MinimalRepeatSelector::DrawIndex(const std::vector<model::Participant>& remaining,
                                        const std::vector<int>& scores) const {
    if (remaining.size() == 1) {
        return 0;
    }

    const auto [min_it, max_it] = std::minmax_element(scores.begin(), scores.end());
    const bool all_tied = (*min_it == *max_it);

    std::vector<double> weights;
    weights.reserve(remaining.size());
    double total = 0.0;
    for (size_t i = 0; i < remaining.size(); ++i) {
        const double base = all_tied ? 1.0 : std::pow(2.0, -static_cast<double>(scores[i]));
        const double weight = base * FairnessMultiplier(remaining[i].id);
        weights.push_back(weight);
        total += weight;
    }

    const double target = random_.UniformUnit() * total;
    double cumulative = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        cumulative += weights[i];
        if (target < cumulative) {
            return i;
        }
    }
    return remaining.size() - 1;
}

void ErasePicked(std::vector<model::Participant>& pool, const std::vector<model::Participant>& picked) {
    std::unordered_set<std::string> ids;
    for (const auto& participant : picked) {
        ids.insert(participant.id);
    }
    pool.erase(std::remove_if(pool.begin(), pool.end(),
                              [&](const model::Participant& participant) {
                                  return ids.count(participant.id) > 0;
                              }),
               pool.end());
}

}  // namespace tablepod::core::pairing
