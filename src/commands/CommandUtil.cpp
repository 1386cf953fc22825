#include "commands/CommandUtil.hpp"

#include <stdexcept>

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

long long get_arg_int(int argc, char** argv, const std::string& key, long long def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects an integer, got '" + s + "'");
    }
    if (used != s.size()) throw std::runtime_error(key + " expects an integer, got '" + s + "'");
    return v;
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects a number, got '" + s + "'");
    }
    if (used != s.size()) throw std::runtime_error(key + " expects a number, got '" + s + "'");
    return v;
}

RecommenderConfig resolve_config(int argc, char** argv) {
    RecommenderConfig cfg;

    const std::string config_path = get_arg(argc, argv, "--config", "");
    if (!config_path.empty()) cfg = loadConfig(config_path, cfg);

    cfg.matrix_path       = get_arg(argc, argv, "--embeddings", cfg.matrix_path);
    cfg.index_path        = get_arg(argc, argv, "--index", cfg.index_path);
    cfg.catalog_path      = get_arg(argc, argv, "--catalog", cfg.catalog_path);
    cfg.interactions_path = get_arg(argc, argv, "--interactions", cfg.interactions_path);
    if (has_flag(argc, argv, "--exclude_rated")) cfg.exclude_rated = true;

    return cfg;
}
