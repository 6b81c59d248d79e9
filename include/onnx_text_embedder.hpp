#pragma once

#include "embedding_model.hpp"
#include "text_embedder.hpp"
#include "tokenizer.hpp"

#include <memory>
#include <string>
#include <vector>

// Forward declarations to avoid including onnxruntime headers here
namespace Ort {
struct Env;
struct Session;
struct SessionOptions;
struct MemoryInfo;
}

// Sentence embeddings from a transformer encoder exported to ONNX.
class OnnxTextEmbedder : public TextEmbedder {
public:
    explicit OnnxTextEmbedder(const LocalEmbeddingModel& model);
    ~OnnxTextEmbedder() override;

    OnnxTextEmbedder(const OnnxTextEmbedder&) = delete;
    OnnxTextEmbedder& operator=(const OnnxTextEmbedder&) = delete;

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

private:
    WordPieceTokenizer tokenizer_;
    Pooling pooling_;

    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::SessionOptions> session_options_;
    std::unique_ptr<Ort::Session> session_;
    std::unique_ptr<Ort::MemoryInfo> memory_info_;

    std::vector<std::string> input_names_;
    std::string output_name_;
};
