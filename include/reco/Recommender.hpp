#pragma once

#include <cstdint>
#include <functional>
#include <unordered_set>
#include <vector>

#include "reco/EmbeddingStore.hpp"
#include "reco/Models.hpp"
#include "reco/Signals.hpp"
#include "reco/Sources.hpp"
#include "reco/WeightScheme.hpp"

namespace reco {

struct RecommenderOptions {
    SignalConfig signals;

    // also drop rated movies from the candidate set
    bool exclude_rated = false;

    // cold-start score = popularity / popularity_divisor
    double popularity_divisor = 1.0;

    // unix seconds; system clock when empty
    std::function<std::int64_t()> clock;
};

struct RecommendationResult {
    bool cold_start = false;
    std::size_t watched_count = 0;
    TierWeights weights = adaptive_weights(0);
    std::vector<Recommendation> items;
};

class Recommender {
public:
    Recommender(EmbeddingStore& store,
                const InteractionReader& interactions,
                const CatalogMetadata& catalog,
                RecommenderOptions opts = {});

    // Ranked, diversified recommendations with a per-signal breakdown.
    // lambda is clamped into [0,1]; k <= 0 yields an empty list.
    std::vector<Recommendation> get_recommendations(UserId user_id, int k, double lambda) const;

    // Same as get_recommendations, plus the path taken and the weights used.
    RecommendationResult recommend(UserId user_id, int k, double lambda) const;

    // Nearest rows to movie_id by raw dot product, excluding the movie itself
    // and anything in exclude. Throws NotEmbedded if movie_id has no row.
    std::vector<SimilarItem> similar_items(MovieId movie_id, std::size_t n,
                                           const std::unordered_set<MovieId>& exclude) const;

    // similar_items with the user's watched movies excluded
    std::vector<SimilarItem> similar_items_for_user(MovieId movie_id, std::size_t n, UserId user_id) const;

    // Cosine similarity of every mapped row against an externally embedded query.
    std::vector<SimilarItem> search_by_vector(const std::vector<float>& query, std::size_t n) const;

private:
    std::int64_t now() const;
    std::vector<Recommendation> cold_start(std::size_t k) const;

    EmbeddingStore& m_store;
    const InteractionReader& m_interactions;
    const CatalogMetadata& m_catalog;
    RecommenderOptions m_opts;
};

}  // namespace reco
