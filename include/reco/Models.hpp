#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reco {

using MovieId = std::int64_t;
using UserId = std::int64_t;

// one raw score per catalog row; index i is the same item across all signals
using ScoreVector = std::vector<double>;

enum class Action {
    Watch,
    Rate,
    Skip,
    Watchlist
};

struct InteractionRecord {
    UserId user_id = 0;
    MovieId movie_id = 0;
    Action action = Action::Watch;
    std::optional<double> rating;  // 0..10
    std::int64_t timestamp = 0;    // unix seconds
};

struct Explanation {
    double interest = 0.0;
    double discovery = 0.0;
    double collaborative = 0.0;
    double category = 0.0;
    double total = 0.0;
};

struct Recommendation {
    MovieId movie_id = 0;
    std::string title;  // display only, empty if the catalog has none
    double combined_score = 0.0;
    Explanation explanation;
};

struct SimilarItem {
    MovieId movie_id = 0;
    double similarity = 0.0;
};

const char* action_str(Action a);
bool parse_action(const std::string& s, Action& out);

}  // namespace reco
