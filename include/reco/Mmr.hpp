#pragma once

#include <cstddef>
#include <vector>

#include "reco/EmbeddingStore.hpp"

namespace reco {

// Maximal Marginal Relevance over matrix rows.
//
// Picks argmax relevance first, then repeatedly the candidate maximizing
//   lambda * relevance[i] - (1 - lambda) * max_{s in selected} dot(row_i, row_s)
// until k rows are picked or candidates run out. Ties go to the candidate that
// comes first in `candidates`. Returns selected rows in pick order.
//
// lambda near 1 ranks by relevance; near 0 it favors rows unlike the ones
// already picked. Cost is O(k * |candidates|) dot products.
std::vector<std::size_t> mmr_rerank(const EmbeddingData& data,
                                    const std::vector<std::size_t>& candidates,
                                    const ScoreVector& relevance,
                                    std::size_t k,
                                    double lambda);

}  // namespace reco
