#include "commands/search.hpp"

#include "commands/CommandUtil.hpp"
#include "emb/MiniLmQueryEmbedder.hpp"
#include "io/JsonIO.hpp"
#include "reco/EmbeddingStore.hpp"
#include "reco/RecommendationsArtifact.hpp"
#include "reco/Recommender.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int search_usage() {
    std::cerr
        << "usage:\n"
        << "  movie-reco search --query \"<text>\" [--n <count>] [--out <path>] [--config <path>]\n"
        << "                    [--model <path>] [--vocab <path>] [--max_len <n>]\n"
        << "                    [--embeddings <path>] [--index <path>] [--catalog <path>]\n"
        << "\n"
        << "  --model                      default: models/emb/model.onnx\n"
        << "  --vocab                      default: models/emb/vocab.txt\n"
        << "  --max_len                    default: 256\n"
        << "  the catalog embeddings must come from the same model as --model\n";
    return 2;
}

int cmd_search(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return search_usage();

    RecommenderConfig cfg;
    emb::MiniLmConfig mcfg;
    std::string query;
    long long n = 20;
    std::string out_path;

    try {
        cfg = resolve_config(argc, argv);
        query = get_arg(argc, argv, "--query", "");
        n = get_arg_int(argc, argv, "--n", 20);
        out_path = get_arg(argc, argv, "--out", "");
        mcfg.model_path = get_arg(argc, argv, "--model", mcfg.model_path);
        mcfg.vocab_path = get_arg(argc, argv, "--vocab", mcfg.vocab_path);
        mcfg.max_len = (std::size_t)get_arg_int(argc, argv, "--max_len", (long long)mcfg.max_len);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return search_usage();
    }

    if (query.empty()) {
        std::cerr << "error: missing --query\n";
        return search_usage();
    }
    if (n < 1) n = 1;

    try {
        auto store = reco::EmbeddingStore::from_files(cfg.matrix_path, cfg.index_path);
        const JsonCatalog catalog = JsonCatalog::from_file(cfg.catalog_path);
        const reco::NullInteractionReader no_interactions;
        reco::Recommender recommender(*store, no_interactions, catalog);

        const emb::MiniLmQueryEmbedder embedder(mcfg);
        const std::vector<float> qv = embedder.embed(query);

        reco::SimilarItemsArtifact art;
        art.query = query;
        art.hits = recommender.search_by_vector(qv, (std::size_t)n);

        std::cout << "SEARCH \"" << query << "\"\n";
        for (const auto& h : art.hits) {
            art.titles.push_back(catalog.title(h.movie_id));
            std::cout << "- [" << h.movie_id << "] " << art.titles.back() << "  similarity=" << h.similarity << "\n";
        }

        if (!out_path.empty()) {
            art.write_to(fs::path(out_path));
            std::cout << "OUT_SEARCH: " << out_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
