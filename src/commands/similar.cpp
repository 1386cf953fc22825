#include "commands/similar.hpp"

#include "commands/CommandUtil.hpp"
#include "io/JsonIO.hpp"
#include "reco/EmbeddingStore.hpp"
#include "reco/Errors.hpp"
#include "reco/RecommendationsArtifact.hpp"
#include "reco/Recommender.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

static int similar_usage() {
    std::cerr
        << "usage:\n"
        << "  movie-reco similar --movie <id> [--n <count>] [--user <id>] [--out <path>] [--config <path>]\n"
        << "                     [--embeddings <path>] [--index <path>] [--catalog <path>] [--interactions <path>]\n"
        << "\n"
        << "  --user excludes movies that user has already watched\n";
    return 2;
}

int cmd_similar(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return similar_usage();

    RecommenderConfig cfg;
    reco::MovieId movie_id = 0;
    long long n = 6;
    bool for_user = false;
    reco::UserId user_id = 0;
    std::string out_path;

    try {
        cfg = resolve_config(argc, argv);
        if (get_arg(argc, argv, "--movie", "").empty()) {
            std::cerr << "error: missing --movie\n";
            return similar_usage();
        }
        movie_id = get_arg_int(argc, argv, "--movie", 0);
        n = get_arg_int(argc, argv, "--n", 6);
        for_user = !get_arg(argc, argv, "--user", "").empty();
        user_id = get_arg_int(argc, argv, "--user", 0);
        out_path = get_arg(argc, argv, "--out", "");
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return similar_usage();
    }
    if (n < 1) n = 1;

    try {
        auto store = reco::EmbeddingStore::from_files(cfg.matrix_path, cfg.index_path);
        const JsonCatalog catalog = JsonCatalog::from_file(cfg.catalog_path);

        std::unique_ptr<reco::InteractionReader> interactions;
        if (for_user) {
            interactions = std::make_unique<JsonInteractionReader>(JsonInteractionReader::from_file(cfg.interactions_path));
        } else {
            interactions = std::make_unique<reco::NullInteractionReader>();
        }

        reco::Recommender recommender(*store, *interactions, catalog);

        reco::SimilarItemsArtifact art;
        art.query = "movie:" + std::to_string(movie_id);
        try {
            art.hits = for_user ? recommender.similar_items_for_user(movie_id, (std::size_t)n, user_id)
                                : recommender.similar_items(movie_id, (std::size_t)n, {});
        } catch (const reco::NotEmbedded& e) {
            std::cout << "similar movies unavailable: " << e.what() << "\n";
            return 0;
        }

        std::cout << "SIMILAR TO [" << movie_id << "] " << catalog.title(movie_id) << "\n";
        for (const auto& h : art.hits) {
            art.titles.push_back(catalog.title(h.movie_id));
            std::cout << "- [" << h.movie_id << "] " << art.titles.back() << "  similarity=" << h.similarity << "\n";
        }

        if (!out_path.empty()) {
            art.write_to(fs::path(out_path));
            std::cout << "OUT_SIMILAR: " << out_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
