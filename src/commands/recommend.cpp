#include "commands/recommend.hpp"

#include "commands/CommandUtil.hpp"
#include "io/JsonIO.hpp"
#include "reco/EmbeddingStore.hpp"
#include "reco/Errors.hpp"
#include "reco/RecommendationsArtifact.hpp"
#include "reco/Recommender.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int recommend_usage() {
    std::cerr
        << "usage:\n"
        << "  movie-reco recommend --user <id> [--k <n>] [--lambda <f>] [--out <path>]\n"
        << "                       [--exclude_rated] [--now <unix seconds>] [--config <path>]\n"
        << "                       [--embeddings <path>] [--index <path>] [--catalog <path>] [--interactions <path>]\n";
    return 2;
}

static void print_recommendations(const reco::RecommendationResult& res, reco::UserId user_id) {
    std::cout << "USER " << user_id;
    if (res.cold_start) {
        std::cout << " (cold start: popularity order)\n";
    } else {
        const auto& w = res.weights.weights;
        std::cout << " (watched=" << res.watched_count << ", tier=" << reco::tier_name(res.weights.tier)
                  << ", weights i/d/c/g=" << w.interest() << "/" << w.discovery() << "/"
                  << w.collaborative() << "/" << w.category() << ")\n";
    }

    std::cout << std::fixed << std::setprecision(4);
    int rank = 1;
    for (const auto& r : res.items) {
        std::cout << std::setw(3) << rank++ << ". [" << r.movie_id << "] "
                  << (r.title.empty() ? "(untitled)" : r.title)
                  << "  score=" << r.combined_score
                  << "  interest=" << r.explanation.interest
                  << " discovery=" << r.explanation.discovery
                  << " collaborative=" << r.explanation.collaborative
                  << " category=" << r.explanation.category << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);
}

int cmd_recommend(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return recommend_usage();

    RecommenderConfig cfg;
    reco::UserId user_id = 0;
    long long k = 0;
    double lambda = 0.0;
    std::int64_t fixed_now = 0;
    std::string out_path;

    try {
        cfg = resolve_config(argc, argv);

        const std::string user = get_arg(argc, argv, "--user", "");
        if (user.empty()) {
            std::cerr << "error: missing --user\n";
            return recommend_usage();
        }
        user_id = get_arg_int(argc, argv, "--user", 0);
        k = get_arg_int(argc, argv, "--k", cfg.default_k);
        lambda = get_arg_double(argc, argv, "--lambda", cfg.default_lambda);
        fixed_now = get_arg_int(argc, argv, "--now", 0);
        out_path = get_arg(argc, argv, "--out", "");
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return recommend_usage();
    }

    k = std::max(1LL, std::min<long long>(cfg.max_k, k));
    lambda = std::max(0.0, std::min(1.0, lambda));

    try {
        auto store = reco::EmbeddingStore::from_files(cfg.matrix_path, cfg.index_path);
        const JsonCatalog catalog = JsonCatalog::from_file(cfg.catalog_path);
        const JsonInteractionReader interactions = JsonInteractionReader::from_file(cfg.interactions_path);

        reco::RecommenderOptions opts;
        opts.signals = cfg.signals;
        opts.exclude_rated = cfg.exclude_rated;
        opts.popularity_divisor = cfg.popularity_divisor;
        if (fixed_now > 0) opts.clock = [fixed_now]() { return fixed_now; };

        reco::Recommender recommender(*store, interactions, catalog, opts);

        reco::RecommendationsArtifact art;
        art.user_id = user_id;
        art.k = (int)k;
        art.lambda = lambda;
        art.result = recommender.recommend(user_id, (int)k, lambda);

        print_recommendations(art.result, user_id);

        if (!out_path.empty()) {
            art.write_to(fs::path(out_path));
            std::cout << "OUT_RECOMMENDATIONS: " << out_path << "\n";
        }
    } catch (const reco::DataUnavailable& e) {
        std::cerr << "error: embeddings unavailable: " << e.what() << "\n";
        return 1;
    } catch (const reco::InconsistentData& e) {
        std::cerr << "error: embeddings inconsistent: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
