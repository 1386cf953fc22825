#include "commands/inspect.hpp"
#include "commands/recommend.hpp"
#include "commands/search.hpp"
#include "commands/similar.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  movie-reco recommend --user <id> [args]\n"
        << "  movie-reco similar --movie <id> [args]\n"
        << "  movie-reco search --query \"<text>\" [args]\n"
        << "  movie-reco inspect [args]\n"
        << "  movie-reco help\n"
        << "\n"
        << "shared:\n"
        << "  --config <path>              JSON config; flags override it\n"
        << "  --embeddings <path>          default: data/embeddings.bin\n"
        << "  --index <path>               default: data/embedding_index.json\n"
        << "  --catalog <path>             default: data/catalog.json\n"
        << "  --interactions <path>        default: data/interactions.json\n"
        << "\n"
        << "run '<command> --help' for command options\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "recommend") return cmd_recommend(argc - 1, argv + 1);
    if (cmd == "similar")   return cmd_similar(argc - 1, argv + 1);
    if (cmd == "search")    return cmd_search(argc - 1, argv + 1);
    if (cmd == "inspect")   return cmd_inspect(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
