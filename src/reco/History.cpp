#include "reco/History.hpp"

#include <unordered_map>
#include <unordered_set>

namespace reco {

std::int64_t days_since(std::int64_t ts, std::int64_t now) {
    if (now <= ts) return 0;
    return (now - ts) / 86400;
}

UserHistory build_history(const std::vector<InteractionRecord>& records, std::int64_t now) {
    UserHistory h;
    h.now = now;

    std::unordered_map<MovieId, std::size_t> watched_pos;
    std::unordered_map<MovieId, std::int64_t> rating_ts;
    std::unordered_set<MovieId> skipped_seen;
    std::unordered_set<MovieId> watchlist_seen;

    for (const auto& r : records) {
        switch (r.action) {
            case Action::Watch: {
                auto it = watched_pos.find(r.movie_id);
                if (it == watched_pos.end()) {
                    watched_pos.emplace(r.movie_id, h.watched.size());
                    h.watched.push_back(WatchedItem{r.movie_id, r.timestamp});
                } else if (r.timestamp > h.watched[it->second].timestamp) {
                    h.watched[it->second].timestamp = r.timestamp;
                }
                break;
            }
            case Action::Rate: {
                if (!r.rating) break;
                auto it = rating_ts.find(r.movie_id);
                if (it == rating_ts.end() || r.timestamp >= it->second) {
                    rating_ts[r.movie_id] = r.timestamp;
                    h.ratings[r.movie_id] = *r.rating;
                }
                break;
            }
            case Action::Skip:
                if (skipped_seen.insert(r.movie_id).second) h.skipped.push_back(r.movie_id);
                break;
            case Action::Watchlist:
                if (watchlist_seen.insert(r.movie_id).second) h.watchlist.push_back(r.movie_id);
                break;
        }
    }

    return h;
}

}  // namespace reco
