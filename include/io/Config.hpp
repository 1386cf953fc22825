#pragma once

#include <string>

#include "reco/Signals.hpp"

struct RecommenderConfig {
    std::string matrix_path = "data/embeddings.bin";
    std::string index_path = "data/embedding_index.json";
    std::string catalog_path = "data/catalog.json";
    std::string interactions_path = "data/interactions.json";

    int default_k = 10;
    int max_k = 50;
    double default_lambda = 0.7;

    bool exclude_rated = false;
    double popularity_divisor = 1.0;

    reco::SignalConfig signals;
};

// Every key is optional; unknown keys are ignored. Wrong types throw
// std::runtime_error naming the key.
RecommenderConfig loadConfig(const std::string& path, RecommenderConfig base = {});
