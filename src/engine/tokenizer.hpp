#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include "incidex/errors.hpp"

namespace incidex::engine {

    /**
     * @brief WordPiece tokenizer over a BERT-style vocab.txt.
     *
     * Lowercases ASCII, splits on whitespace and ASCII punctuation (each
     * punctuation mark becomes its own word), and leaves multi-byte UTF-8
     * sequences untouched so multilingual vocabularies still match.
     */
    class Tokenizer {
    public:
        explicit Tokenizer(const std::string& vocab_path) {
            load_vocab(vocab_path);
            m_cls = special("[CLS]", 101);
            m_sep = special("[SEP]", 102);
            m_unk = special("[UNK]", 100);
            m_pad = special("[PAD]", 0);
        }

        std::vector<int64_t> encode(const std::string& text, size_t max_length = 256) const {
            std::vector<int64_t> ids;
            ids.push_back(m_cls);

            for (const auto& word : split_words(text)) {
                if (ids.size() >= max_length - 1) break; // Reserve 1 for [SEP]
                append_word_pieces(word, ids);
            }

            if (ids.size() > max_length - 1) ids.resize(max_length - 1);
            ids.push_back(m_sep);
            return ids;
        }

        int64_t pad_id() const { return m_pad; }
        size_t vocab_size() const { return m_vocab.size(); }

    private:
        std::unordered_map<std::string, int64_t> m_vocab;
        int64_t m_cls = 101;
        int64_t m_sep = 102;
        int64_t m_unk = 100;
        int64_t m_pad = 0;

        void load_vocab(const std::string& path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                throw Error(ErrorKind::InvalidConfig, "failed to load vocab: " + path);
            }
            std::string line;
            int64_t id = 0;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_vocab.emplace(line, id++);
            }
        }

        int64_t special(const std::string& token, int64_t fallback) const {
            auto it = m_vocab.find(token);
            return it != m_vocab.end() ? it->second : fallback;
        }

        static std::vector<std::string> split_words(const std::string& text) {
            std::vector<std::string> words;
            std::string current;
            auto flush = [&]() {
                if (!current.empty()) words.push_back(current);
                current.clear();
            };
            for (unsigned char c : text) {
                if (c < 0x80 && std::isspace(c)) {
                    flush();
                } else if (c < 0x80 && std::ispunct(c)) {
                    flush();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    current.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
                }
            }
            flush();
            return words;
        }

        void append_word_pieces(const std::string& word, std::vector<int64_t>& ids) const {
            // Max WordPiece length check to avoid stalls
            if (word.length() > 100) {
                ids.push_back(m_unk);
                return;
            }

            std::vector<int64_t> pieces;
            size_t start = 0;
            while (start < word.length()) {
                size_t end = word.length();
                int64_t piece = -1;
                while (start < end) {
                    std::string candidate = word.substr(start, end - start);
                    if (start > 0) candidate = "##" + candidate;
                    auto it = m_vocab.find(candidate);
                    if (it != m_vocab.end()) {
                        piece = it->second;
                        break;
                    }
                    end--;
                }
                if (piece == -1) {
                    ids.push_back(m_unk);
                    return;
                }
                pieces.push_back(piece);
                start = end;
            }
            ids.insert(ids.end(), pieces.begin(), pieces.end());
        }
    };

}
