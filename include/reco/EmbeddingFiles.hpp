#pragma once

#include <string>
#include <utility>

#include "reco/EmbeddingStore.hpp"

namespace reco {

// Binary matrix blob:
//   uint32 rows, uint32 dim, uint64 value_count, float32[rows*dim] (row-major)
class BinaryMatrixFile final : public EmbeddingSource {
public:
    explicit BinaryMatrixFile(std::string path) : m_path(std::move(path)) {}
    EmbeddingMatrix load() const override;

private:
    std::string m_path;
};

// {"model": str, "dimension": int, "entries": [{"movie_id", "embedding_index", "title"}]}
class JsonIndexFile final : public IndexSource {
public:
    explicit JsonIndexFile(std::string path) : m_path(std::move(path)) {}
    IndexDocument load() const override;

private:
    std::string m_path;
};

// throws std::runtime_error if the file cannot be written
void save_embedding_matrix(const std::string& path, const EmbeddingMatrix& matrix);

}  // namespace reco
