#include "io/JsonIO.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return j;
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static const json& require_array(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    return arr;
}

static std::int64_t require_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    return j.at(key).get<std::int64_t>();
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static double number_or(const json& j, const char* key, double def, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return def;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static CatalogMovie parseMovie(const json& j, const std::string& where) {
    require_object(j, where);

    CatalogMovie m;
    m.id = require_int(j, "id", where);
    if (j.contains("title") && j.at("title").is_string()) m.title = j.at("title").get<std::string>();
    m.popularity = number_or(j, "popularity", 0.0, where);

    if (j.contains("genres")) {
        const json& genres = require_array(j, "genres", where);
        for (std::size_t i = 0; i < genres.size(); ++i) {
            if (!genres.at(i).is_string()) {
                std::ostringstream oss;
                oss << where << ".genres[" << i << "] must be a string";
                throw std::runtime_error(oss.str());
            }
            m.genres.insert(genres.at(i).get<std::string>());
        }
    }
    return m;
}

static reco::InteractionRecord parseInteraction(const json& j, const std::string& where) {
    require_object(j, where);

    reco::InteractionRecord r;
    r.user_id = require_int(j, "user_id", where);
    r.movie_id = require_int(j, "movie_id", where);
    r.timestamp = require_int(j, "timestamp", where);

    const std::string action = require_string(j, "action", where);
    if (!reco::parse_action(action, r.action)) {
        throw std::runtime_error(where + ".action has unknown value: " + action);
    }

    if (j.contains("rating") && !j.at("rating").is_null()) {
        const double rating = number_or(j, "rating", 0.0, where);
        if (rating < 0.0 || rating > 10.0) {
            throw std::runtime_error(where + ".rating must be within 0..10");
        }
        r.rating = rating;
    }
    return r;
}

std::vector<CatalogMovie> loadCatalog(const std::string& path) {
    const json j = read_json_file(path, "catalog");
    require_object(j, "root");

    const json& movies = require_array(j, "movies", "root");
    std::vector<CatalogMovie> out;
    out.reserve(movies.size());
    for (std::size_t i = 0; i < movies.size(); ++i) {
        std::ostringstream oss;
        oss << "root.movies[" << i << "]";
        out.push_back(parseMovie(movies.at(i), oss.str()));
    }
    return out;
}

std::vector<reco::InteractionRecord> loadInteractions(const std::string& path) {
    const json j = read_json_file(path, "interactions");
    require_object(j, "root");

    const json& items = require_array(j, "interactions", "root");
    std::vector<reco::InteractionRecord> out;
    out.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        std::ostringstream oss;
        oss << "root.interactions[" << i << "]";
        out.push_back(parseInteraction(items.at(i), oss.str()));
    }
    return out;
}

JsonCatalog::JsonCatalog(const std::vector<CatalogMovie>& movies) {
    m_ids.reserve(movies.size());
    m_movies.reserve(movies.size() * 2 + 8);
    for (const auto& m : movies) {
        if (!m_movies.emplace(m.id, m).second) {
            throw std::runtime_error("catalog lists movie " + std::to_string(m.id) + " twice");
        }
        m_ids.push_back(m.id);
    }
}

std::set<std::string> JsonCatalog::genres(reco::MovieId movie_id) const {
    auto it = m_movies.find(movie_id);
    if (it == m_movies.end()) return {};
    return it->second.genres;
}

double JsonCatalog::popularity(reco::MovieId movie_id) const {
    auto it = m_movies.find(movie_id);
    if (it == m_movies.end()) return 0.0;
    return it->second.popularity;
}

std::string JsonCatalog::title(reco::MovieId movie_id) const {
    auto it = m_movies.find(movie_id);
    if (it == m_movies.end()) return {};
    return it->second.title;
}

JsonInteractionReader::JsonInteractionReader(const std::vector<reco::InteractionRecord>& records) {
    for (const auto& r : records) m_by_user[r.user_id].push_back(r);
}

std::vector<reco::InteractionRecord> JsonInteractionReader::get(reco::UserId user_id) const {
    auto it = m_by_user.find(user_id);
    if (it == m_by_user.end()) return {};
    return it->second;
}
