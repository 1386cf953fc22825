#include "commands/inspect.hpp"

#include "commands/CommandUtil.hpp"
#include "reco/EmbeddingStore.hpp"

#include <iostream>

static int inspect_usage() {
    std::cerr
        << "usage:\n"
        << "  movie-reco inspect [--config <path>] [--embeddings <path>] [--index <path>]\n";
    return 2;
}

int cmd_inspect(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return inspect_usage();

    try {
        const RecommenderConfig cfg = resolve_config(argc, argv);
        auto store = reco::EmbeddingStore::from_files(cfg.matrix_path, cfg.index_path);
        const reco::EmbeddingData& data = store->load();

        std::cout << "embeddings: " << cfg.matrix_path << "\n";
        std::cout << "index:      " << cfg.index_path << "\n";
        if (!data.model().empty()) std::cout << "model:      " << data.model() << "\n";
        std::cout << "rows:       " << data.rows() << "\n";
        std::cout << "dim:        " << data.dim() << "\n";
        std::cout << "mapped:     " << data.mapped_rows() << "\n";
        std::cout << "unmapped:   " << (data.rows() - data.mapped_rows()) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
