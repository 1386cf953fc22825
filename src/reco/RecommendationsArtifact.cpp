#include "reco/RecommendationsArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace reco {

static nlohmann::json recommendation_to_json(const Recommendation& r) {
    nlohmann::json j;
    j["movie_id"] = r.movie_id;
    j["title"] = r.title;
    j["score"] = r.combined_score;
    j["explanation"] = {
        {"interest", r.explanation.interest},
        {"discovery", r.explanation.discovery},
        {"collaborative", r.explanation.collaborative},
        {"category", r.explanation.category},
        {"total", r.explanation.total},
    };
    return j;
}

static void write_json(const std::filesystem::path& out_path, const nlohmann::json& j) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << j.dump(2) << "\n";
}

nlohmann::json RecommendationsArtifact::to_json() const {
    nlohmann::json j;

    j["user_id"] = user_id;
    j["k"] = k;
    j["lambda"] = lambda;
    j["cold_start"] = result.cold_start;
    j["watched_count"] = result.watched_count;

    const SignalWeights& w = result.weights.weights;
    j["weights"] = {
        {"tier", tier_name(result.weights.tier)},
        {"interest", w.interest()},
        {"discovery", w.discovery()},
        {"collaborative", w.collaborative()},
        {"category", w.category()},
    };

    nlohmann::json recs = nlohmann::json::array();
    for (const auto& r : result.items) recs.push_back(recommendation_to_json(r));
    j["recommendations"] = recs;

    return j;
}

void RecommendationsArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(out_path, to_json());
}

nlohmann::json SimilarItemsArtifact::to_json() const {
    nlohmann::json j;
    j["query"] = query;

    nlohmann::json arr = nlohmann::json::array();
    for (std::size_t i = 0; i < hits.size(); ++i) {
        nlohmann::json h;
        h["movie_id"] = hits[i].movie_id;
        if (i < titles.size()) h["title"] = titles[i];
        h["similarity"] = hits[i].similarity;
        arr.push_back(h);
    }
    j["results"] = arr;
    return j;
}

void SimilarItemsArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(out_path, to_json());
}

}  // namespace reco
