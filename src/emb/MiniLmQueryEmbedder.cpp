#include "emb/MiniLmQueryEmbedder.hpp"

#include <cmath>
#include <stdexcept>

namespace emb {

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    const double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

MiniLmQueryEmbedder::MiniLmQueryEmbedder(const MiniLmConfig& cfg)
    : m_cfg(cfg), m_tok(WordPieceTokenizer::from_vocab_file(cfg.vocab_path)) {
    try {
        m_opts.SetIntraOpNumThreads(cfg.intra_op_threads);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
        m_session = std::make_unique<Ort::Session>(m_env, cfg.model_path.c_str(), m_opts);

        Ort::AllocatorWithDefaultOptions allocator;
        const std::size_t n_inputs = m_session->GetInputCount();
        for (std::size_t i = 0; i < n_inputs; ++i) {
            auto name = m_session->GetInputNameAllocated(i, allocator);
            m_input_names.emplace_back(name.get());
        }
        auto out_name = m_session->GetOutputNameAllocated(0, allocator);
        m_output_name = out_name.get();
    } catch (const Ort::Exception& e) {
        throw std::runtime_error("MiniLmQueryEmbedder: failed to load " + cfg.model_path + ": " + e.what());
    }

    if (m_input_names.size() < 2 || m_input_names.size() > 3) {
        throw std::runtime_error("MiniLmQueryEmbedder: expected 2 or 3 model inputs, got " +
                                 std::to_string(m_input_names.size()));
    }
}

std::vector<float> MiniLmQueryEmbedder::embed(const std::string& text) const {
    Encoding enc = m_tok.encode(text, m_cfg.max_len);
    const std::size_t seq_len = enc.input_ids.size();
    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    // inputs are matched by name; models exported without token_type_ids take two
    std::vector<Ort::Value> inputs;
    std::vector<const char*> input_names;
    for (const auto& name : m_input_names) {
        std::vector<int64_t>* src = nullptr;
        if (name == "input_ids") src = &enc.input_ids;
        else if (name == "attention_mask") src = &enc.attention_mask;
        else if (name == "token_type_ids") src = &enc.token_type_ids;
        else throw std::runtime_error("MiniLmQueryEmbedder: unexpected model input: " + name);

        inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, src->data(), src->size(), shape.data(), shape.size()));
        input_names.push_back(name.c_str());
    }

    const char* out_names[1] = {m_output_name.c_str()};
    std::vector<Ort::Value> outs;
    try {
        outs = m_session->Run(Ort::RunOptions{nullptr}, input_names.data(), inputs.data(), inputs.size(),
                              out_names, 1);
    } catch (const Ort::Exception& e) {
        throw std::runtime_error(std::string("MiniLmQueryEmbedder: inference failed: ") + e.what());
    }

    auto info = outs[0].GetTensorTypeAndShapeInfo();
    auto shp = info.GetShape();  // [1, seq_len, hidden]
    if (shp.size() != 3) {
        throw std::runtime_error("MiniLmQueryEmbedder: expected rank-3 token embeddings, got rank " +
                                 std::to_string(shp.size()));
    }

    const auto hidden = (std::size_t)shp[2];
    const float* data = outs[0].GetTensorData<float>();

    std::vector<float> pooled(hidden, 0.0f);
    double denom = 0.0;
    for (std::size_t t = 0; t < seq_len; ++t) {
        if (enc.attention_mask[t] == 0) continue;
        denom += 1.0;
        const float* row = data + t * hidden;
        for (std::size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
    }
    if (denom > 0.0) {
        const float inv = (float)(1.0 / denom);
        for (float& x : pooled) x *= inv;
    }

    l2_normalize(pooled);
    return pooled;
}

}  // namespace emb
