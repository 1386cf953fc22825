#pragma once

#include <cstddef>
#include <unordered_set>
#include <vector>

#include "reco/EmbeddingStore.hpp"
#include "reco/Signals.hpp"

namespace reco {

struct WeightedSignal {
    SignalKind kind = SignalKind::Interest;
    double weight = 0.0;
    ScoreVector scores;
};

// combined[i] = sum over signals of weight * scores[i]
// throws std::invalid_argument if a signal does not have `rows` entries
ScoreVector fuse(const std::vector<WeightedSignal>& signals, std::size_t rows);

// Mapped rows whose movie is not in `excluded`, ascending row order.
std::vector<std::size_t> candidate_rows(const EmbeddingData& data, const std::unordered_set<MovieId>& excluded);

}  // namespace reco
