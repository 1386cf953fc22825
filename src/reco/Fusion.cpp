#include "reco/Fusion.hpp"

#include <stdexcept>
#include <string>

namespace reco {

ScoreVector fuse(const std::vector<WeightedSignal>& signals, std::size_t rows) {
    ScoreVector combined(rows, 0.0);
    for (const auto& s : signals) {
        if (s.scores.size() != rows) {
            throw std::invalid_argument(std::string("signal '") + signal_name(s.kind) + "' has " +
                                        std::to_string(s.scores.size()) + " scores, expected " +
                                        std::to_string(rows));
        }
        for (std::size_t i = 0; i < rows; ++i) combined[i] += s.weight * s.scores[i];
    }
    return combined;
}

std::vector<std::size_t> candidate_rows(const EmbeddingData& data, const std::unordered_set<MovieId>& excluded) {
    std::vector<std::size_t> out;
    out.reserve(data.mapped_rows());
    for (std::size_t row = 0; row < data.rows(); ++row) {
        auto movie = data.movie_at(row);
        if (!movie) continue;
        if (excluded.find(*movie) != excluded.end()) continue;
        out.push_back(row);
    }
    return out;
}

}  // namespace reco
