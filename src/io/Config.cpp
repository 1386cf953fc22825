#include "io/Config.hpp"

#include <fstream>
#include <stdexcept>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

static void read_string(const json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_string()) throw std::runtime_error(std::string("config.") + key + " must be a string");
    out = j.at(key).get<std::string>();
}

static void read_int(const json& j, const char* key, int& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number_integer()) throw std::runtime_error(std::string("config.") + key + " must be an integer");
    out = j.at(key).get<int>();
}

static void read_double(const json& j, const char* key, double& out, const std::string& prefix = "config.") {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number()) throw std::runtime_error(prefix + key + " must be a number");
    out = j.at(key).get<double>();
}

static void read_bool(const json& j, const char* key, bool& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_boolean()) throw std::runtime_error(std::string("config.") + key + " must be a boolean");
    out = j.at(key).get<bool>();
}

RecommenderConfig loadConfig(const std::string& path, RecommenderConfig cfg) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open config file: " + path);

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse config JSON: ") + e.what());
    }
    if (!j.is_object()) throw std::runtime_error("config root must be an object");

    read_string(j, "embeddings", cfg.matrix_path);
    read_string(j, "index", cfg.index_path);
    read_string(j, "catalog", cfg.catalog_path);
    read_string(j, "interactions", cfg.interactions_path);

    read_int(j, "default_k", cfg.default_k);
    read_int(j, "max_k", cfg.max_k);
    read_double(j, "default_lambda", cfg.default_lambda);
    read_bool(j, "exclude_rated", cfg.exclude_rated);
    read_double(j, "popularity_divisor", cfg.popularity_divisor);

    if (j.contains("signals")) {
        const json& s = j.at("signals");
        if (!s.is_object()) throw std::runtime_error("config.signals must be an object");
        read_double(s, "half_life_days", cfg.signals.half_life_days, "config.signals.");
        read_double(s, "neutral_rating", cfg.signals.neutral_rating, "config.signals.");
        read_double(s, "rating_scale", cfg.signals.rating_scale, "config.signals.");
        read_double(s, "dislike_threshold", cfg.signals.dislike_threshold, "config.signals.");
        read_double(s, "normalize_epsilon", cfg.signals.normalize_epsilon, "config.signals.");
    }

    if (cfg.max_k < 1) throw std::runtime_error("config.max_k must be at least 1");
    if (cfg.signals.half_life_days <= 0.0) throw std::runtime_error("config.signals.half_life_days must be positive");
    if (cfg.signals.rating_scale <= 0.0) throw std::runtime_error("config.signals.rating_scale must be positive");
    if (!(cfg.signals.normalize_epsilon > 0.0)) {
        throw std::runtime_error("config.signals.normalize_epsilon must be positive");
    }
    if (cfg.popularity_divisor <= 0.0) throw std::runtime_error("config.popularity_divisor must be positive");

    return cfg;
}
