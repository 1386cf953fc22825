#include "reco/EmbeddingFiles.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "nlohmann/json.hpp"
#include "reco/Errors.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace reco {

EmbeddingMatrix BinaryMatrixFile::load() const {
    std::ifstream in(m_path, std::ios::binary);
    if (!in) throw DataUnavailable("embedding matrix not found or unreadable: " + m_path);

    std::uint32_t rows = 0, dim = 0;
    std::uint64_t value_count = 0;
    in.read(reinterpret_cast<char*>(&rows), sizeof(rows));
    in.read(reinterpret_cast<char*>(&dim), sizeof(dim));
    in.read(reinterpret_cast<char*>(&value_count), sizeof(value_count));
    if (!in) throw DataUnavailable("embedding matrix header truncated: " + m_path);
    if (dim == 0) throw DataUnavailable("embedding matrix has zero dimension: " + m_path);
    if (value_count != static_cast<std::uint64_t>(rows) * dim) {
        std::ostringstream oss;
        oss << "embedding matrix header mismatch in " << m_path << ": rows=" << rows
            << " dim=" << dim << " value_count=" << value_count;
        throw DataUnavailable(oss.str());
    }

    // header must agree with the bytes on disk before anything is allocated
    std::error_code ec;
    const std::uintmax_t file_bytes = fs::file_size(m_path, ec);
    if (ec) throw DataUnavailable("embedding matrix size unreadable: " + m_path + ": " + ec.message());
    constexpr std::uint64_t kHeaderBytes = 2 * sizeof(std::uint32_t) + sizeof(std::uint64_t);
    const std::uint64_t body_bytes = file_bytes < kHeaderBytes ? 0 : file_bytes - kHeaderBytes;
    if (body_bytes / sizeof(float) != value_count || body_bytes % sizeof(float) != 0) {
        std::ostringstream oss;
        oss << "embedding matrix " << m_path << " declares " << value_count << " values but holds "
            << body_bytes << " body bytes";
        throw DataUnavailable(oss.str());
    }

    EmbeddingMatrix m;
    m.rows = rows;
    m.dim = dim;
    m.values.resize(static_cast<std::size_t>(value_count));
    in.read(reinterpret_cast<char*>(m.values.data()),
            static_cast<std::streamsize>(sizeof(float) * m.values.size()));
    if (!in) throw DataUnavailable("embedding matrix body truncated: " + m_path);
    return m;
}

void save_embedding_matrix(const std::string& path, const EmbeddingMatrix& matrix) {
    if (matrix.values.size() != matrix.rows * matrix.dim) {
        throw std::invalid_argument("save_embedding_matrix: values do not match rows*dim");
    }

    const fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());

    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + path);

    const auto rows = static_cast<std::uint32_t>(matrix.rows);
    const auto dim = static_cast<std::uint32_t>(matrix.dim);
    const auto value_count = static_cast<std::uint64_t>(matrix.values.size());
    out.write(reinterpret_cast<const char*>(&rows), sizeof(rows));
    out.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
    out.write(reinterpret_cast<const char*>(&value_count), sizeof(value_count));
    out.write(reinterpret_cast<const char*>(matrix.values.data()),
              static_cast<std::streamsize>(sizeof(float) * matrix.values.size()));
    if (!out) throw std::runtime_error("failed to write embedding matrix: " + path);
}

static std::int64_t require_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw DataUnavailable(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number_integer()) {
        throw DataUnavailable(where + "." + std::string(key) + " must be an integer");
    }
    return j.at(key).get<std::int64_t>();
}

IndexDocument JsonIndexFile::load() const {
    std::ifstream in(m_path);
    if (!in) throw DataUnavailable("embedding index not found or unreadable: " + m_path);

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw DataUnavailable("failed to parse embedding index " + m_path + ": " + e.what());
    }

    if (!j.is_object()) throw DataUnavailable("embedding index root must be an object: " + m_path);
    if (!j.contains("entries") || !j.at("entries").is_array()) {
        throw DataUnavailable("embedding index missing entries array: " + m_path);
    }

    IndexDocument doc;
    if (j.contains("model") && j.at("model").is_string()) doc.model = j.at("model").get<std::string>();
    if (j.contains("dimension") && j.at("dimension").is_number_unsigned()) {
        doc.dimension = j.at("dimension").get<std::size_t>();
    }

    const json& entries = j.at("entries");
    doc.entries.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        std::ostringstream oss;
        oss << "root.entries[" << i << "]";
        const std::string where = oss.str();

        const json& e = entries.at(i);
        if (!e.is_object()) throw DataUnavailable(where + " must be an object");

        IndexEntry entry;
        entry.movie_id = require_int(e, "movie_id", where);
        entry.row = require_int(e, "embedding_index", where);
        if (e.contains("title") && e.at("title").is_string()) entry.title = e.at("title").get<std::string>();
        doc.entries.push_back(std::move(entry));
    }
    return doc;
}

}  // namespace reco
