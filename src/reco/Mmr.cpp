#include "reco/Mmr.hpp"

#include <algorithm>
#include <limits>

namespace reco {

std::vector<std::size_t> mmr_rerank(const EmbeddingData& data,
                                    const std::vector<std::size_t>& candidates,
                                    const ScoreVector& relevance,
                                    std::size_t k,
                                    double lambda) {
    std::vector<std::size_t> selected;
    if (candidates.empty() || k == 0) return selected;

    const std::size_t want = std::min(k, candidates.size());
    selected.reserve(want);

    std::vector<std::size_t> remaining = candidates;

    // max similarity of each remaining candidate to the selected set,
    // kept up to date as picks are made
    std::vector<double> max_sim(remaining.size(), -std::numeric_limits<double>::infinity());

    // first pick: pure relevance
    std::size_t best = 0;
    for (std::size_t i = 1; i < remaining.size(); ++i) {
        if (relevance[remaining[i]] > relevance[remaining[best]]) best = i;
    }

    while (true) {
        const std::size_t picked = remaining[best];
        selected.push_back(picked);
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best));
        max_sim.erase(max_sim.begin() + static_cast<std::ptrdiff_t>(best));

        if (selected.size() >= want || remaining.empty()) break;

        for (std::size_t i = 0; i < remaining.size(); ++i) {
            max_sim[i] = std::max(max_sim[i], data.dot(remaining[i], picked));
        }

        best = 0;
        double best_score = -std::numeric_limits<double>::infinity();
        for (std::size_t i = 0; i < remaining.size(); ++i) {
            const double score = lambda * relevance[remaining[i]] - (1.0 - lambda) * max_sim[i];
            if (score > best_score) {
                best_score = score;
                best = i;
            }
        }
    }

    return selected;
}

}  // namespace reco
