#include "embedding_model.hpp"
#include "onnx_text_embedder.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace {

std::string read_text(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw EmbeddingError("Cannot read embedding model file " + path);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::vector<char> read_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw EmbeddingError("Cannot read embedding model file " + path);
    }
    return std::vector<char>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Expected layout of a cached model: <cache>/<name>/onnx/model.onnx next to
// the tokenizer files.
EmbeddingModelFilePaths cached_model_paths(const OnlineEmbeddingModel& online) {
    const std::filesystem::path root = std::filesystem::path(online.cache_dir) / online.model_name;
    EmbeddingModelFilePaths paths;
    paths.onnx = (root / "onnx" / "model.onnx").string();
    paths.tokenizer = (root / "tokenizer.json").string();
    paths.config = (root / "config.json").string();
    paths.special_tokens_map = (root / "special_tokens_map.json").string();
    paths.tokenizer_config = (root / "tokenizer_config.json").string();
    return paths;
}

} // namespace

LocalEmbeddingModel EmbeddingModelFilePaths::to_local_embedding_model() const {
    LocalEmbeddingModel model;
    model.onnx_file = read_bytes(onnx);
    model.tokenizer_files.tokenizer_file = read_text(tokenizer);
    model.tokenizer_files.config_file = read_text(config);
    model.tokenizer_files.special_tokens_map_file = read_text(special_tokens_map);
    model.tokenizer_files.tokenizer_config_file = read_text(tokenizer_config);
    return model;
}

std::unique_ptr<TextEmbedder> make_text_embedder(const EmbeddingModelSource& source) {
    if (const auto* local = std::get_if<LocalEmbeddingModel>(&source)) {
        return std::make_unique<OnnxTextEmbedder>(*local);
    }

    const auto& online = std::get<OnlineEmbeddingModel>(source);
    LocalEmbeddingModel model = cached_model_paths(online).to_local_embedding_model();
    model.pooling = online.pooling;
    return std::make_unique<OnnxTextEmbedder>(model);
}
