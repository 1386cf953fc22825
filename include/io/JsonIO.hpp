#pragma once

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "reco/Models.hpp"
#include "reco/Sources.hpp"

struct CatalogMovie {
    reco::MovieId id = 0;
    std::string title;
    double popularity = 0.0;
    std::set<std::string> genres;
};

// {"movies": [{"id", "title", "popularity", "genres": [...]}]}
std::vector<CatalogMovie> loadCatalog(const std::string& path);

// {"interactions": [{"user_id", "movie_id", "action", "rating", "timestamp"}]}
std::vector<reco::InteractionRecord> loadInteractions(const std::string& path);

class JsonCatalog final : public reco::CatalogMetadata {
public:
    explicit JsonCatalog(const std::vector<CatalogMovie>& movies);
    static JsonCatalog from_file(const std::string& path) { return JsonCatalog(loadCatalog(path)); }

    std::set<std::string> genres(reco::MovieId movie_id) const override;
    double popularity(reco::MovieId movie_id) const override;
    std::vector<reco::MovieId> movie_ids() const override { return m_ids; }
    std::string title(reco::MovieId movie_id) const override;

    std::size_t size() const { return m_ids.size(); }

private:
    std::vector<reco::MovieId> m_ids;  // file order
    std::unordered_map<reco::MovieId, CatalogMovie> m_movies;
};

class JsonInteractionReader final : public reco::InteractionReader {
public:
    explicit JsonInteractionReader(const std::vector<reco::InteractionRecord>& records);
    static JsonInteractionReader from_file(const std::string& path) {
        return JsonInteractionReader(loadInteractions(path));
    }

    std::vector<reco::InteractionRecord> get(reco::UserId user_id) const override;

private:
    std::map<reco::UserId, std::vector<reco::InteractionRecord>> m_by_user;
};
