#include "reco/Signals.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <unordered_set>

namespace reco {

const char* signal_name(SignalKind k) {
    switch (k) {
        case SignalKind::Interest: return "interest";
        case SignalKind::Discovery: return "discovery";
        case SignalKind::Collaborative: return "collaborative";
        case SignalKind::Category: return "category";
        default: return "unknown";
    }
}

static void add_row(std::vector<double>& acc, const EmbeddingData& data, std::size_t row, double w) {
    const float* r = data.matrix().row(row);
    for (std::size_t j = 0; j < acc.size(); ++j) acc[j] += w * static_cast<double>(r[j]);
}

// Plain mean of the given rows; empty rows -> empty centroid.
static std::vector<double> mean_of_rows(const EmbeddingData& data, const std::vector<std::size_t>& rows) {
    if (rows.empty()) return {};
    std::vector<double> c(data.dim(), 0.0);
    for (std::size_t r : rows) add_row(c, data, r, 1.0);
    const double inv = 1.0 / static_cast<double>(rows.size());
    for (double& x : c) x *= inv;
    return c;
}

ScoreVector InterestSignal::compute(const UserHistory& history) const {
    ScoreVector zeros(m_data.rows(), 0.0);
    if (history.watched.empty()) return zeros;

    std::vector<std::size_t> rows;
    std::vector<double> weights;
    rows.reserve(history.watched.size());
    weights.reserve(history.watched.size());

    for (const auto& w : history.watched) {
        auto row = m_data.row_of(w.movie_id);
        if (!row) continue;

        const double days = static_cast<double>(days_since(w.timestamp, history.now));
        const double time_weight = std::pow(0.5, days / m_cfg.half_life_days);

        auto rit = history.ratings.find(w.movie_id);
        const double rating = (rit == history.ratings.end()) ? m_cfg.neutral_rating : rit->second;
        const double rating_weight = rating / m_cfg.rating_scale;

        rows.push_back(*row);
        weights.push_back(time_weight * rating_weight);
    }

    if (rows.empty()) return zeros;

    double total = 0.0;
    for (double w : weights) total += w;
    // every watched movie rated 0, or decayed to nothing
    if (!(total > 0.0)) return zeros;

    std::vector<double> centroid(m_data.dim(), 0.0);
    for (std::size_t i = 0; i < rows.size(); ++i) add_row(centroid, m_data, rows[i], weights[i] / total);

    return m_data.scores_against(centroid);
}

ScoreVector DiscoverySignal::compute(const UserHistory& history) const {
    ScoreVector zeros(m_data.rows(), 0.0);

    std::vector<MovieId> disliked;
    std::unordered_set<MovieId> seen;
    for (MovieId m : history.skipped) {
        if (seen.insert(m).second) disliked.push_back(m);
    }
    for (const auto& [movie, rating] : history.ratings) {
        if (rating < m_cfg.dislike_threshold && seen.insert(movie).second) disliked.push_back(movie);
    }
    if (disliked.empty()) return zeros;

    std::vector<std::size_t> rows;
    rows.reserve(disliked.size());
    for (MovieId m : disliked) {
        if (auto row = m_data.row_of(m)) rows.push_back(*row);
    }
    if (rows.empty()) return zeros;

    const std::vector<double> bad = mean_of_rows(m_data, rows);
    ScoreVector s = m_data.scores_against(bad);
    if (s.empty()) return s;

    for (double& x : s) x = -x;

    const double lo = *std::min_element(s.begin(), s.end());
    const double hi = *std::max_element(s.begin(), s.end());

    // flat scores carry no preference
    if (!(hi > lo)) return zeros;

    const double denom = hi - lo + m_cfg.normalize_epsilon;
    for (double& x : s) x = (x - lo) / denom;
    return s;
}

ScoreVector CollaborativeSignal::compute(const UserHistory& history) const {
    ScoreVector zeros(m_data.rows(), 0.0);
    if (history.watched.empty()) return zeros;

    std::vector<std::size_t> rows;
    rows.reserve(history.watched.size());
    for (const auto& w : history.watched) {
        if (auto row = m_data.row_of(w.movie_id)) rows.push_back(*row);
    }
    if (rows.empty()) return zeros;

    // mean_i dot(row, w_i) == dot(row, mean_i w_i)
    return m_data.scores_against(mean_of_rows(m_data, rows));
}

ScoreVector CategorySignal::compute(const UserHistory& history) const {
    ScoreVector scores(m_data.rows(), 0.0);
    if (history.watched.empty()) return scores;

    std::map<std::string, int> genre_counts;
    for (const auto& w : history.watched) {
        for (const auto& g : m_catalog.genres(w.movie_id)) genre_counts[g]++;
    }
    if (genre_counts.empty()) return scores;

    const double total = static_cast<double>(history.watched.size());
    std::map<std::string, double> prefs;
    for (const auto& [genre, count] : genre_counts) prefs[genre] = count / total;

    double max_score = 0.0;
    for (std::size_t row = 0; row < m_data.rows(); ++row) {
        auto movie = m_data.movie_at(row);
        if (!movie) continue;

        double s = 0.0;
        for (const auto& g : m_catalog.genres(*movie)) {
            auto it = prefs.find(g);
            if (it != prefs.end()) s += it->second;
        }
        scores[row] = s;
        max_score = std::max(max_score, s);
    }

    if (max_score > 0.0) {
        for (double& x : scores) x /= max_score;
    }
    return scores;
}

std::vector<std::unique_ptr<SignalComputer>> make_default_signals(const EmbeddingData& data,
                                                                  const CatalogMetadata& catalog,
                                                                  const SignalConfig& cfg) {
    std::vector<std::unique_ptr<SignalComputer>> out;
    out.reserve(4);
    out.push_back(std::make_unique<InterestSignal>(data, cfg));
    out.push_back(std::make_unique<DiscoverySignal>(data, cfg));
    out.push_back(std::make_unique<CollaborativeSignal>(data));
    out.push_back(std::make_unique<CategorySignal>(data, catalog));
    return out;
}

}  // namespace reco
