#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "reco/Recommender.hpp"

namespace reco {

struct RecommendationsArtifact {
    UserId user_id = 0;
    int k = 0;
    double lambda = 0.0;

    RecommendationResult result;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// hits from `similar` or `search`
struct SimilarItemsArtifact {
    std::string query;  // "movie:<id>" or the search text
    std::vector<SimilarItem> hits;
    std::vector<std::string> titles;  // parallel to hits, may be empty

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace reco
