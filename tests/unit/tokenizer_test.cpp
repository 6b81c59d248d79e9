#include <cassert>
#include <string>
#include <vector>
#include "text_embedder.hpp"
#include "tokenizer.hpp"

namespace {

const char* kTokenizer = R"({
  "normalizer": {"type": "BertNormalizer", "lowercase": true},
  "model": {
    "type": "WordPiece",
    "unk_token": "[UNK]",
    "continuing_subword_prefix": "##",
    "max_input_chars_per_word": 100,
    "vocab": {
      "[PAD]": 0, "[UNK]": 1, "[CLS]": 2, "[SEP]": 3,
      "hello": 4, "world": 5, ",": 6, "!": 7,
      "un": 8, "##aff": 9, "##able": 10, "caf": 11, "##é": 12
    }
  }
})";

const char* kConfig = R"({"max_position_embeddings": 8, "pad_token_id": 0})";

const char* kSpecialTokens = R"({
  "cls_token": "[CLS]",
  "sep_token": {"content": "[SEP]", "lstrip": false},
  "unk_token": {"content": "[UNK]"},
  "pad_token": "[PAD]"
})";

const char* kTokenizerConfig = R"({"do_lower_case": true, "model_max_length": 512})";

using Pieces = std::vector<std::string>;

} // namespace

int main() {
    WordPieceTokenizer tok = WordPieceTokenizer::from_json(kTokenizer, kConfig, kSpecialTokens, kTokenizerConfig);
    assert(tok.max_length() == 8);
    assert(tok.pad_id() == 0);

    assert((tok.tokenize("Hello, World!") == Pieces{"hello", ",", "world", "!"}));
    assert((tok.tokenize("  unaffable\t") == Pieces{"un", "##aff", "##able"}));
    assert((tok.tokenize("hello xyz") == Pieces{"hello", "[UNK]"}));
    assert((tok.tokenize("caf\xc3\xa9") == Pieces{"caf", "##\xc3\xa9"}));
    assert(tok.tokenize("").empty());

    Encoding enc = tok.encode("hello world");
    assert((enc.ids == std::vector<int64_t>{2, 4, 5, 3}));
    assert((enc.attention_mask == std::vector<int64_t>{1, 1, 1, 1}));
    assert((enc.type_ids == std::vector<int64_t>{0, 0, 0, 0}));

    // Truncated to max_length including the special tokens.
    Encoding longer = tok.encode("hello hello hello hello hello hello hello hello hello");
    assert(longer.ids.size() == 8);
    assert(longer.ids.front() == 2);
    assert(longer.ids.back() == 3);

    bool threw = false;
    try {
        WordPieceTokenizer::from_json("{not json", kConfig, kSpecialTokens, kTokenizerConfig);
    } catch (const EmbeddingError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        WordPieceTokenizer::from_json(R"({"model": {"vocab": {"hello": 0}}})", kConfig, kSpecialTokens,
                                      kTokenizerConfig);
    } catch (const EmbeddingError&) {
        threw = true;
    }
    assert(threw);
    return 0;
}
