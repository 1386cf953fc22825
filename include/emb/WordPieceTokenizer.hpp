#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace emb {

struct Encoding {
    std::vector<int64_t> input_ids;      // [CLS] ... [SEP]
    std::vector<int64_t> attention_mask; // all ones, no padding
    std::vector<int64_t> token_type_ids; // all zeros, single segment
};

// Uncased BERT WordPiece: lowercase, split on whitespace and ASCII punctuation,
// then greedy longest-match-first against the vocabulary.
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(std::vector<std::string> vocab);

    // one token per line, line number = id; throws std::runtime_error
    static WordPieceTokenizer from_vocab_file(const std::string& path);

    std::vector<std::string> tokenize(const std::string& text) const;

    // truncated so that [CLS] + pieces + [SEP] fit in max_len
    Encoding encode(const std::string& text, std::size_t max_len) const;

    std::size_t vocab_size() const { return m_vocab.size(); }
    int64_t token_id(const std::string& token) const;

private:
    std::vector<std::string> m_vocab;
    std::unordered_map<std::string, int64_t> m_ids;
    int64_t m_unk = -1;
    int64_t m_cls = -1;
    int64_t m_sep = -1;

    static constexpr std::size_t kMaxWordChars = 100;

    std::vector<std::string> split_words(const std::string& text) const;
    void append_pieces(const std::string& word, std::vector<std::string>& out) const;
};

}  // namespace emb
