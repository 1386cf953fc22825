#include "reco/EmbeddingStore.hpp"

#include <iostream>
#include <string>
#include <utility>

#include "reco/EmbeddingFiles.hpp"
#include "reco/Errors.hpp"

namespace reco {

static double dot_raw(const float* a, const float* b, std::size_t dim) {
    double s = 0.0;
    for (std::size_t i = 0; i < dim; ++i) s += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    return s;
}

std::unique_ptr<EmbeddingData> EmbeddingData::build(EmbeddingMatrix matrix, const IndexDocument& index) {
    if (matrix.values.size() != matrix.rows * matrix.dim) {
        throw InconsistentData("embedding matrix holds " + std::to_string(matrix.values.size()) +
                               " values, expected " + std::to_string(matrix.rows * matrix.dim));
    }
    if (index.dimension != 0 && index.dimension != matrix.dim) {
        throw InconsistentData("index declares dimension " + std::to_string(index.dimension) +
                               " but matrix has " + std::to_string(matrix.dim));
    }

    auto d = std::make_unique<EmbeddingData>(BuildTag{});
    d->m_row_to_movie.assign(matrix.rows, std::nullopt);
    d->m_movie_to_row.reserve(index.entries.size() * 2 + 8);

    const auto n = static_cast<std::int64_t>(matrix.rows);
    for (const auto& e : index.entries) {
        if (e.row < 0 || e.row >= n) {
            throw InconsistentData("movie " + std::to_string(e.movie_id) + " maps to row " +
                                   std::to_string(e.row) + " outside [0, " + std::to_string(n) + ")");
        }
        const auto row = static_cast<std::size_t>(e.row);

        if (d->m_row_to_movie[row].has_value()) {
            throw InconsistentData("row " + std::to_string(row) + " is mapped by movies " +
                                   std::to_string(*d->m_row_to_movie[row]) + " and " +
                                   std::to_string(e.movie_id));
        }
        if (!d->m_movie_to_row.emplace(e.movie_id, row).second) {
            throw InconsistentData("movie " + std::to_string(e.movie_id) + " appears twice in the index");
        }
        d->m_row_to_movie[row] = e.movie_id;
    }

    d->m_model = index.model;
    d->m_matrix = std::move(matrix);
    return d;
}

std::optional<std::size_t> EmbeddingData::row_of(MovieId movie_id) const {
    auto it = m_movie_to_row.find(movie_id);
    if (it == m_movie_to_row.end()) return std::nullopt;
    return it->second;
}

std::optional<MovieId> EmbeddingData::movie_at(std::size_t row) const {
    if (row >= m_row_to_movie.size()) return std::nullopt;
    return m_row_to_movie[row];
}

double EmbeddingData::dot(std::size_t a, std::size_t b) const {
    return dot_raw(m_matrix.row(a), m_matrix.row(b), m_matrix.dim);
}

double EmbeddingData::dot(std::size_t row, const std::vector<double>& v) const {
    const float* r = m_matrix.row(row);
    double s = 0.0;
    for (std::size_t i = 0; i < m_matrix.dim; ++i) s += static_cast<double>(r[i]) * v[i];
    return s;
}

ScoreVector EmbeddingData::scores_against(const std::vector<double>& v) const {
    ScoreVector out(m_matrix.rows, 0.0);
    if (v.size() != m_matrix.dim) return out;
    for (std::size_t i = 0; i < m_matrix.rows; ++i) out[i] = dot(i, v);
    return out;
}

EmbeddingStore::EmbeddingStore(std::unique_ptr<EmbeddingSource> matrix_source,
                               std::unique_ptr<IndexSource> index_source)
    : m_matrix_source(std::move(matrix_source)), m_index_source(std::move(index_source)) {}

std::unique_ptr<EmbeddingStore> EmbeddingStore::from_files(const std::string& matrix_path,
                                                           const std::string& index_path) {
    return std::make_unique<EmbeddingStore>(std::make_unique<BinaryMatrixFile>(matrix_path),
                                            std::make_unique<JsonIndexFile>(index_path));
}

const EmbeddingData& EmbeddingStore::load() {
    if (m_loaded.load(std::memory_order_acquire)) return *m_data;

    std::lock_guard<std::mutex> lock(m_mu);
    if (m_loaded.load(std::memory_order_relaxed)) return *m_data;

    if (!m_matrix_source || !m_index_source) {
        throw DataUnavailable("EmbeddingStore: no embedding or index source configured");
    }

    EmbeddingMatrix matrix = m_matrix_source->load();
    IndexDocument index = m_index_source->load();

    std::unique_ptr<EmbeddingData> data = EmbeddingData::build(std::move(matrix), index);

    const std::size_t unmapped = data->rows() - data->mapped_rows();
    std::cerr << "EmbeddingStore: loaded rows=" << data->rows() << " dim=" << data->dim()
              << " mapped=" << data->mapped_rows() << " unmapped=" << unmapped << "\n";
    if (unmapped > 0) {
        std::cerr << "EmbeddingStore: warning: " << unmapped
                  << " rows have no movie id and are excluded from results\n";
    }

    m_data = std::move(data);
    m_loaded.store(true, std::memory_order_release);
    return *m_data;
}

}  // namespace reco
