#pragma once

#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "emb/QueryEmbedder.hpp"
#include "emb/WordPieceTokenizer.hpp"

namespace emb {

struct MiniLmConfig {
    std::string model_path = "models/emb/model.onnx";
    std::string vocab_path = "models/emb/vocab.txt";
    std::size_t max_len = 256;
    int intra_op_threads = 1;
};

// Sentence-transformer (MiniLM family) run through ONNX Runtime:
// WordPiece -> encoder -> masked mean pooling -> L2 normalization.
class MiniLmQueryEmbedder final : public QueryEmbedder {
public:
    // throws std::runtime_error if the vocab or model cannot be loaded
    explicit MiniLmQueryEmbedder(const MiniLmConfig& cfg);

    std::vector<float> embed(const std::string& text) const override;

private:
    MiniLmConfig m_cfg;
    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "movie-reco"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::vector<std::string> m_input_names;
    std::string m_output_name;
};

}  // namespace emb
