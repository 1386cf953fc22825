#include "emb/WordPieceTokenizer.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace emb {

static bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool is_ascii_punct(unsigned char c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) || (c >= 91 && c <= 96) || (c >= 123 && c <= 126);
}

WordPieceTokenizer::WordPieceTokenizer(std::vector<std::string> vocab) : m_vocab(std::move(vocab)) {
    m_ids.reserve(m_vocab.size() * 2 + 8);
    for (std::size_t i = 0; i < m_vocab.size(); ++i) {
        m_ids.emplace(m_vocab[i], static_cast<int64_t>(i));
    }

    auto special = [&](const char* tok) {
        auto it = m_ids.find(tok);
        if (it == m_ids.end()) throw std::runtime_error(std::string("vocabulary has no ") + tok + " token");
        return it->second;
    };
    m_unk = special("[UNK]");
    m_cls = special("[CLS]");
    m_sep = special("[SEP]");
}

WordPieceTokenizer WordPieceTokenizer::from_vocab_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open vocab file: " + path);

    std::vector<std::string> vocab;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        vocab.push_back(line);
    }
    if (vocab.empty()) throw std::runtime_error("vocab file is empty: " + path);
    return WordPieceTokenizer(std::move(vocab));
}

int64_t WordPieceTokenizer::token_id(const std::string& token) const {
    auto it = m_ids.find(token);
    return it == m_ids.end() ? m_unk : it->second;
}

std::vector<std::string> WordPieceTokenizer::split_words(const std::string& text) const {
    std::vector<std::string> words;
    std::string cur;

    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_space(c)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
        } else if (is_ascii_punct(c)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
            words.emplace_back(1, ch);
        } else if (c >= 'A' && c <= 'Z') {
            cur.push_back(static_cast<char>(c - 'A' + 'a'));
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) words.push_back(std::move(cur));
    return words;
}

void WordPieceTokenizer::append_pieces(const std::string& word, std::vector<std::string>& out) const {
    if (word.size() > kMaxWordChars) {
        out.push_back("[UNK]");
        return;
    }

    std::vector<std::string> pieces;
    std::size_t start = 0;
    while (start < word.size()) {
        std::size_t end = word.size();
        std::string match;
        while (end > start) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) sub.insert(0, "##");
            if (m_ids.count(sub)) {
                match = std::move(sub);
                break;
            }
            --end;
        }
        // any unmatched stretch makes the whole word unknown
        if (match.empty()) {
            out.push_back("[UNK]");
            return;
        }
        pieces.push_back(std::move(match));
        start = end;
    }

    for (auto& p : pieces) out.push_back(std::move(p));
}

std::vector<std::string> WordPieceTokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> out;
    for (const auto& w : split_words(text)) append_pieces(w, out);
    return out;
}

Encoding WordPieceTokenizer::encode(const std::string& text, std::size_t max_len) const {
    if (max_len < 2) throw std::invalid_argument("max_len must leave room for [CLS] and [SEP]");

    Encoding enc;
    enc.input_ids.push_back(m_cls);

    for (const auto& piece : tokenize(text)) {
        if (enc.input_ids.size() + 1 >= max_len) break;
        enc.input_ids.push_back(token_id(piece));
    }
    enc.input_ids.push_back(m_sep);

    enc.attention_mask.assign(enc.input_ids.size(), 1);
    enc.token_type_ids.assign(enc.input_ids.size(), 0);
    return enc;
}

}  // namespace emb
