#include "tokenizer.hpp"
#include "text_embedder.hpp"

#include <nlohmann/json.hpp>

#include <cctype>

using json = nlohmann::json;

namespace {

// special_tokens_map entries are either "[CLS]" or {"content": "[CLS]", ...}.
std::string token_content(const json& map, const char* key, const std::string& fallback) {
    auto it = map.find(key);
    if (it == map.end()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_object() && it->contains("content")) return (*it)["content"].get<std::string>();
    return fallback;
}

bool is_continuation_byte(unsigned char c) { return (c & 0xC0) == 0x80; }

bool is_ascii_punct(unsigned char c) { return c < 0x80 && std::ispunct(c); }

bool is_ascii_space(unsigned char c) { return c < 0x80 && std::isspace(c); }

} // namespace

WordPieceTokenizer WordPieceTokenizer::from_json(const std::string& tokenizer_json,
                                                 const std::string& config_json,
                                                 const std::string& special_tokens_map_json,
                                                 const std::string& tokenizer_config_json) {
    WordPieceTokenizer tok;
    try {
        const json tokenizer = json::parse(tokenizer_json);
        const json config = json::parse(config_json);
        const json special = json::parse(special_tokens_map_json);
        const json tokenizer_config = json::parse(tokenizer_config_json);

        const json& model = tokenizer.at("model");
        if (model.value("type", std::string("WordPiece")) != "WordPiece") {
            throw EmbeddingError("Unsupported tokenizer model: " + model.value("type", std::string()));
        }
        for (auto it = model.at("vocab").begin(); it != model.at("vocab").end(); ++it) {
            tok.vocab_.emplace(it.key(), it.value().get<int64_t>());
        }
        tok.unk_token_ = model.value("unk_token", tok.unk_token_);
        tok.prefix_ = model.value("continuing_subword_prefix", tok.prefix_);
        tok.max_chars_per_word_ = model.value("max_input_chars_per_word", tok.max_chars_per_word_);

        auto normalizer = tokenizer.find("normalizer");
        if (normalizer != tokenizer.end() && normalizer->is_object()) {
            tok.lowercase_ = normalizer->value("lowercase", tok.lowercase_);
        }
        tok.lowercase_ = tokenizer_config.value("do_lower_case", tok.lowercase_);

        tok.cls_token_ = token_content(special, "cls_token", tok.cls_token_);
        tok.sep_token_ = token_content(special, "sep_token", tok.sep_token_);
        tok.unk_token_ = token_content(special, "unk_token", tok.unk_token_);

        std::size_t max_positions = config.value("max_position_embeddings", std::size_t{512});
        tok.max_length_ = max_positions;
        auto model_max = tokenizer_config.find("model_max_length");
        if (model_max != tokenizer_config.end() && model_max->is_number()) {
            // Some configs store a huge sentinel here.
            double v = model_max->get<double>();
            if (v > 0 && v < static_cast<double>(max_positions)) {
                tok.max_length_ = static_cast<std::size_t>(v);
            }
        }

        tok.pad_id_ = config.value("pad_token_id", int64_t{0});
        std::string pad_token = token_content(special, "pad_token", "");
        if (!pad_token.empty() && tok.vocab_.count(pad_token)) {
            tok.pad_id_ = tok.vocab_.at(pad_token);
        }
    } catch (const json::exception& e) {
        throw EmbeddingError(std::string("Malformed tokenizer files: ") + e.what());
    }

    if (!tok.vocab_.count(tok.unk_token_) || !tok.vocab_.count(tok.cls_token_) ||
        !tok.vocab_.count(tok.sep_token_)) {
        throw EmbeddingError("Tokenizer vocabulary lacks its special tokens");
    }
    if (tok.max_length_ < 2) {
        throw EmbeddingError("Tokenizer max length too small");
    }
    return tok;
}

std::vector<std::string> WordPieceTokenizer::split_words(const std::string& text) const {
    std::vector<std::string> words;
    std::string current;
    auto flush = [&] {
        if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    };

    for (unsigned char c : text) {
        if (is_ascii_space(c) || std::iscntrl(c)) {
            flush();
        } else if (is_ascii_punct(c)) {
            flush();
            words.emplace_back(1, static_cast<char>(c));
        } else {
            current.push_back(lowercase_ && c < 0x80 ? static_cast<char>(std::tolower(c))
                                                     : static_cast<char>(c));
        }
    }
    flush();
    return words;
}

void WordPieceTokenizer::word_pieces(const std::string& word, std::vector<std::string>& out) const {
    if (word.size() > max_chars_per_word_) {
        out.push_back(unk_token_);
        return;
    }

    std::vector<std::string> pieces;
    std::size_t start = 0;
    while (start < word.size()) {
        std::size_t end = word.size();
        std::string match;
        while (start < end) {
            // Never cut inside a UTF-8 sequence.
            if (end < word.size() && is_continuation_byte(static_cast<unsigned char>(word[end]))) {
                --end;
                continue;
            }
            std::string candidate = word.substr(start, end - start);
            if (start > 0) candidate = prefix_ + candidate;
            if (vocab_.count(candidate)) {
                match = std::move(candidate);
                break;
            }
            --end;
        }
        if (match.empty()) {
            out.push_back(unk_token_);
            return;
        }
        pieces.push_back(std::move(match));
        start = end;
    }
    out.insert(out.end(), pieces.begin(), pieces.end());
}

int64_t WordPieceTokenizer::id_of(const std::string& token) const {
    auto it = vocab_.find(token);
    return it != vocab_.end() ? it->second : vocab_.at(unk_token_);
}

std::vector<std::string> WordPieceTokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> pieces;
    for (const auto& word : split_words(text)) {
        word_pieces(word, pieces);
    }
    return pieces;
}

Encoding WordPieceTokenizer::encode(const std::string& text) const {
    std::vector<std::string> pieces = tokenize(text);
    if (pieces.size() > max_length_ - 2) {
        pieces.resize(max_length_ - 2);
    }

    Encoding enc;
    enc.ids.reserve(pieces.size() + 2);
    enc.ids.push_back(id_of(cls_token_));
    for (const auto& piece : pieces) {
        enc.ids.push_back(id_of(piece));
    }
    enc.ids.push_back(id_of(sep_token_));
    enc.attention_mask.assign(enc.ids.size(), 1);
    enc.type_ids.assign(enc.ids.size(), 0);
    return enc;
}
