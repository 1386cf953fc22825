#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "reco/Models.hpp"

namespace reco {

struct EmbeddingMatrix {
    std::size_t rows = 0;
    std::size_t dim = 0;
    std::vector<float> values;  // packed row-major: size = rows*dim

    const float* row(std::size_t i) const { return values.data() + i * dim; }
};

struct IndexEntry {
    MovieId movie_id = 0;
    std::int64_t row = 0;  // signed so bad source data can be reported, not wrapped
    std::string title;
};

struct IndexDocument {
    std::string model;
    std::size_t dimension = 0;  // 0 = not declared
    std::vector<IndexEntry> entries;
};

class EmbeddingSource {
public:
    virtual ~EmbeddingSource() = default;
    virtual EmbeddingMatrix load() const = 0;
};

class IndexSource {
public:
    virtual ~IndexSource() = default;
    virtual IndexDocument load() const = 0;
};

// Immutable matrix + movie id <-> row mapping. Only EmbeddingStore builds one.
class EmbeddingData {
    struct BuildTag {};

public:
    static std::unique_ptr<EmbeddingData> build(EmbeddingMatrix matrix, const IndexDocument& index);

    explicit EmbeddingData(BuildTag) {}

    const EmbeddingMatrix& matrix() const { return m_matrix; }
    std::size_t rows() const { return m_matrix.rows; }
    std::size_t dim() const { return m_matrix.dim; }
    const std::string& model() const { return m_model; }

    std::optional<std::size_t> row_of(MovieId movie_id) const;
    std::optional<MovieId> movie_at(std::size_t row) const;
    std::size_t mapped_rows() const { return m_movie_to_row.size(); }

    // raw dot products; normalization is the generator's business
    double dot(std::size_t a, std::size_t b) const;
    double dot(std::size_t row, const std::vector<double>& v) const;

    // matrix . v for every row
    ScoreVector scores_against(const std::vector<double>& v) const;

private:
    EmbeddingMatrix m_matrix;
    std::string m_model;
    std::unordered_map<MovieId, std::size_t> m_movie_to_row;
    std::vector<std::optional<MovieId>> m_row_to_movie;
};

// Load-once owner of the embedding data. load() is safe to call from any
// thread; once it has succeeded, callers read without taking the lock.
class EmbeddingStore {
public:
    EmbeddingStore(std::unique_ptr<EmbeddingSource> matrix_source,
                   std::unique_ptr<IndexSource> index_source);

    static std::unique_ptr<EmbeddingStore> from_files(const std::string& matrix_path,
                                                      const std::string& index_path);

    EmbeddingStore(const EmbeddingStore&) = delete;
    EmbeddingStore& operator=(const EmbeddingStore&) = delete;

    // throws DataUnavailable / InconsistentData; nothing is published on failure
    const EmbeddingData& load();

    bool loaded() const { return m_loaded.load(std::memory_order_acquire); }

private:
    std::unique_ptr<EmbeddingSource> m_matrix_source;
    std::unique_ptr<IndexSource> m_index_source;

    std::mutex m_mu;
    std::atomic<bool> m_loaded{false};
    std::unique_ptr<const EmbeddingData> m_data;
};

}  // namespace reco
