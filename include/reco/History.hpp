#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "reco/Models.hpp"

namespace reco {

struct WatchedItem {
    MovieId movie_id = 0;
    std::int64_t timestamp = 0;  // most recent watch
};

// Per-request snapshot of a user's interactions, grouped by what the signals need.
struct UserHistory {
    std::vector<WatchedItem> watched;  // distinct movies, first-seen order
    std::map<MovieId, double> ratings; // latest rating per movie
    std::vector<MovieId> skipped;      // distinct
    std::vector<MovieId> watchlist;    // distinct, not used for scoring
    std::int64_t now = 0;              // unix seconds the request is evaluated at

    // cold start: nothing watched and nothing skipped
    bool is_cold() const { return watched.empty() && skipped.empty(); }
};

UserHistory build_history(const std::vector<InteractionRecord>& records, std::int64_t now);

// whole days between ts and now, never negative
std::int64_t days_since(std::int64_t ts, std::int64_t now);

}  // namespace reco
