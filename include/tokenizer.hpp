#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

struct Encoding {
    std::vector<int64_t> ids;
    std::vector<int64_t> attention_mask;
    std::vector<int64_t> type_ids;
};

// BERT-style WordPiece tokenizer configured from Hugging Face tokenizer
// files. Only ASCII case folding is applied.
class WordPieceTokenizer {
public:
    // Throws EmbeddingError on malformed or unsupported documents.
    static WordPieceTokenizer from_json(const std::string& tokenizer_json, const std::string& config_json,
                                        const std::string& special_tokens_map_json,
                                        const std::string& tokenizer_config_json);

    // Word pieces without special tokens.
    std::vector<std::string> tokenize(const std::string& text) const;

    // [CLS] pieces [SEP], truncated to max_length().
    Encoding encode(const std::string& text) const;

    int64_t pad_id() const { return pad_id_; }
    std::size_t max_length() const { return max_length_; }

private:
    WordPieceTokenizer() = default;

    std::vector<std::string> split_words(const std::string& text) const;
    void word_pieces(const std::string& word, std::vector<std::string>& out) const;
    int64_t id_of(const std::string& token) const;

    std::unordered_map<std::string, int64_t> vocab_;
    std::string unk_token_ = "[UNK]";
    std::string cls_token_ = "[CLS]";
    std::string sep_token_ = "[SEP]";
    std::string prefix_ = "##";
    bool lowercase_ = true;
    std::size_t max_chars_per_word_ = 100;
    std::size_t max_length_ = 512;
    int64_t pad_id_ = 0;
};
