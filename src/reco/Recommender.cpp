#include "reco/Recommender.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "reco/Errors.hpp"
#include "reco/Fusion.hpp"
#include "reco/History.hpp"
#include "reco/Mmr.hpp"

namespace reco {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

Recommender::Recommender(EmbeddingStore& store,
                         const InteractionReader& interactions,
                         const CatalogMetadata& catalog,
                         RecommenderOptions opts)
    : m_store(store), m_interactions(interactions), m_catalog(catalog), m_opts(std::move(opts)) {}

std::int64_t Recommender::now() const {
    if (m_opts.clock) return m_opts.clock();
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::vector<Recommendation> Recommender::cold_start(std::size_t k) const {
    struct Popular {
        MovieId id;
        double popularity;
    };

    std::vector<Popular> all;
    for (MovieId id : m_catalog.movie_ids()) all.push_back(Popular{id, m_catalog.popularity(id)});

    std::sort(all.begin(), all.end(), [](const Popular& a, const Popular& b) {
        if (a.popularity != b.popularity) return a.popularity > b.popularity;
        return a.id < b.id;
    });
    if (all.size() > k) all.resize(k);

    const double divisor = (m_opts.popularity_divisor > 0.0) ? m_opts.popularity_divisor : 1.0;

    std::vector<Recommendation> out;
    out.reserve(all.size());
    for (const auto& p : all) {
        Recommendation r;
        r.movie_id = p.id;
        r.title = m_catalog.title(p.id);
        r.combined_score = p.popularity / divisor;
        r.explanation.total = r.combined_score;
        out.push_back(std::move(r));
    }
    return out;
}

RecommendationResult Recommender::recommend(UserId user_id, int k, double lambda) const {
    const EmbeddingData& data = m_store.load();

    RecommendationResult res;
    if (k <= 0) return res;
    const auto want = static_cast<std::size_t>(k);
    lambda = clamp01(lambda);

    const UserHistory history = build_history(m_interactions.get(user_id), now());
    res.watched_count = history.watched.size();
    res.weights = adaptive_weights(history.watched.size());

    if (history.is_cold()) {
        res.cold_start = true;
        res.items = cold_start(want);
        return res;
    }

    const SignalWeights& w = res.weights.weights;

    std::vector<WeightedSignal> signals;
    for (const auto& computer : make_default_signals(data, m_catalog, m_opts.signals)) {
        WeightedSignal ws;
        ws.kind = computer->kind();
        ws.weight = w.of(ws.kind);
        ws.scores = computer->compute(history);
        signals.push_back(std::move(ws));
    }

    const ScoreVector combined = fuse(signals, data.rows());

    std::unordered_set<MovieId> excluded;
    for (const auto& item : history.watched) excluded.insert(item.movie_id);
    if (m_opts.exclude_rated) {
        for (const auto& kv : history.ratings) excluded.insert(kv.first);
    }

    const std::vector<std::size_t> candidates = candidate_rows(data, excluded);
    const std::vector<std::size_t> picked = mmr_rerank(data, candidates, combined, want, lambda);

    res.items.reserve(picked.size());
    for (std::size_t row : picked) {
        auto movie = data.movie_at(row);
        if (!movie) continue;

        Recommendation r;
        r.movie_id = *movie;
        r.title = m_catalog.title(*movie);
        r.combined_score = combined[row];
        for (const auto& s : signals) {
            const double contribution = s.weight * s.scores[row];
            switch (s.kind) {
                case SignalKind::Interest: r.explanation.interest = contribution; break;
                case SignalKind::Discovery: r.explanation.discovery = contribution; break;
                case SignalKind::Collaborative: r.explanation.collaborative = contribution; break;
                case SignalKind::Category: r.explanation.category = contribution; break;
            }
        }
        r.explanation.total = combined[row];
        res.items.push_back(std::move(r));
    }

    return res;
}

std::vector<Recommendation> Recommender::get_recommendations(UserId user_id, int k, double lambda) const {
    return recommend(user_id, k, lambda).items;
}

std::vector<SimilarItem> Recommender::similar_items(MovieId movie_id, std::size_t n,
                                                    const std::unordered_set<MovieId>& exclude) const {
    const EmbeddingData& data = m_store.load();

    auto query_row = data.row_of(movie_id);
    if (!query_row) throw NotEmbedded("movie " + std::to_string(movie_id) + " has no embedding");

    const float* q = data.matrix().row(*query_row);
    std::vector<double> qv(q, q + data.dim());
    const ScoreVector sims = data.scores_against(qv);

    std::vector<std::size_t> order(sims.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return sims[a] > sims[b]; });

    std::vector<SimilarItem> out;
    for (std::size_t row : order) {
        if (out.size() >= n) break;

        auto movie = data.movie_at(row);
        if (!movie) continue;
        if (*movie == movie_id) continue;
        if (exclude.find(*movie) != exclude.end()) continue;

        out.push_back(SimilarItem{*movie, sims[row]});
    }
    return out;
}

std::vector<SimilarItem> Recommender::similar_items_for_user(MovieId movie_id, std::size_t n,
                                                             UserId user_id) const {
    std::unordered_set<MovieId> watched;
    for (const auto& r : m_interactions.get(user_id)) {
        if (r.action == Action::Watch) watched.insert(r.movie_id);
    }
    return similar_items(movie_id, n, watched);
}

std::vector<SimilarItem> Recommender::search_by_vector(const std::vector<float>& query, std::size_t n) const {
    const EmbeddingData& data = m_store.load();

    if (query.size() != data.dim()) {
        throw std::invalid_argument("query has dimension " + std::to_string(query.size()) +
                                    ", embeddings have " + std::to_string(data.dim()));
    }

    std::vector<double> qv(query.begin(), query.end());
    double qn = 0.0;
    for (double x : qv) qn += x * x;
    qn = std::sqrt(qn);

    std::vector<SimilarItem> hits;
    hits.reserve(data.mapped_rows());
    for (std::size_t row = 0; row < data.rows(); ++row) {
        auto movie = data.movie_at(row);
        if (!movie) continue;

        const double rn = std::sqrt(data.dot(row, row));
        const double sim = (qn == 0.0 || rn == 0.0) ? 0.0 : data.dot(row, qv) / (rn * qn);
        hits.push_back(SimilarItem{*movie, sim});
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const SimilarItem& a, const SimilarItem& b) { return a.similarity > b.similarity; });
    if (hits.size() > n) hits.resize(n);
    return hits;
}

}  // namespace reco
