#pragma once

#include "text_embedder.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

enum class Pooling {
    Cls,   // hidden state of the first token
    Mean,  // attention-masked average over tokens
};

// The four structured-text companions of an embedding network.
struct TokenizerFiles {
    std::string tokenizer_file;
    std::string config_file;
    std::string special_tokens_map_file;
    std::string tokenizer_config_file;
};

// Model bytes and tokenizer files supplied by the caller.
struct LocalEmbeddingModel {
    std::vector<char> onnx_file;
    TokenizerFiles tokenizer_files;
    Pooling pooling = Pooling::Cls;
};

// A published model looked up by name in a local model cache. Nothing is
// fetched; the cache must already hold the files.
struct OnlineEmbeddingModel {
    std::string model_name = "Xenova/bge-small-en-v1.5";
    std::string cache_dir = "models/embeddings";
    Pooling pooling = Pooling::Cls;
};

using EmbeddingModelSource = std::variant<OnlineEmbeddingModel, LocalEmbeddingModel>;

struct EmbeddingModelFilePaths {
    std::string onnx;
    std::string tokenizer;
    std::string config;
    std::string special_tokens_map;
    std::string tokenizer_config;

    // Reads all five files fully. Throws EmbeddingError naming the first
    // file that cannot be read.
    LocalEmbeddingModel to_local_embedding_model() const;
};

// Throws EmbeddingError if the model cannot be initialized.
std::unique_ptr<TextEmbedder> make_text_embedder(const EmbeddingModelSource& source);
