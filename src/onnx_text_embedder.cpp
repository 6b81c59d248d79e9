#include "onnx_text_embedder.hpp"
#include "logging.hpp"

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <cmath>

namespace {

void normalize_embedding(std::vector<float>& emb) {
    double norm = 0.0;
    for (float val : emb) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 1e-12) {
        for (float& val : emb) {
            val /= static_cast<float>(norm);
        }
    }
}

} // namespace

OnnxTextEmbedder::OnnxTextEmbedder(const LocalEmbeddingModel& model)
    : tokenizer_(WordPieceTokenizer::from_json(model.tokenizer_files.tokenizer_file,
                                               model.tokenizer_files.config_file,
                                               model.tokenizer_files.special_tokens_map_file,
                                               model.tokenizer_files.tokenizer_config_file)),
      pooling_(model.pooling) {
    if (model.onnx_file.empty()) {
        throw EmbeddingError("Embedding model file is empty");
    }

    try {
        env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "hark-embedding");
        session_options_ = std::make_unique<Ort::SessionOptions>();
        session_options_->SetIntraOpNumThreads(2);
        session_options_->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        session_ = std::make_unique<Ort::Session>(*env_, model.onnx_file.data(), model.onnx_file.size(),
                                                  *session_options_);

        Ort::AllocatorWithDefaultOptions allocator;
        for (std::size_t i = 0; i < session_->GetInputCount(); ++i) {
            input_names_.emplace_back(session_->GetInputNameAllocated(i, allocator).get());
        }
        if (session_->GetOutputCount() == 0) {
            throw EmbeddingError("Embedding model has no outputs");
        }
        output_name_ = session_->GetOutputNameAllocated(0, allocator).get();

        memory_info_ = std::make_unique<Ort::MemoryInfo>(
            Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault));
    } catch (const Ort::Exception& e) {
        throw EmbeddingError(std::string("Failed to build text embedding model: ") + e.what());
    }

    for (const auto& name : input_names_) {
        if (name != "input_ids" && name != "attention_mask" && name != "token_type_ids") {
            throw EmbeddingError("Unsupported embedding model input: " + name);
        }
    }

    log_info("Loaded text embedding model (" + std::to_string(input_names_.size()) + " inputs, output " +
             output_name_ + ")");
}

OnnxTextEmbedder::~OnnxTextEmbedder() = default;

std::vector<std::vector<float>> OnnxTextEmbedder::embed(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    std::vector<Encoding> encodings;
    encodings.reserve(texts.size());
    std::size_t seq_len = 0;
    for (const auto& text : texts) {
        encodings.push_back(tokenizer_.encode(text));
        seq_len = std::max(seq_len, encodings.back().ids.size());
    }

    // Pad the batch to its longest member.
    const std::size_t batch = texts.size();
    std::vector<int64_t> ids(batch * seq_len, tokenizer_.pad_id());
    std::vector<int64_t> mask(batch * seq_len, 0);
    std::vector<int64_t> types(batch * seq_len, 0);
    for (std::size_t b = 0; b < batch; ++b) {
        const Encoding& enc = encodings[b];
        std::copy(enc.ids.begin(), enc.ids.end(), ids.begin() + b * seq_len);
        std::copy(enc.attention_mask.begin(), enc.attention_mask.end(), mask.begin() + b * seq_len);
        std::copy(enc.type_ids.begin(), enc.type_ids.end(), types.begin() + b * seq_len);
    }

    std::vector<std::vector<float>> result;
    try {
        std::vector<int64_t> shape{static_cast<int64_t>(batch), static_cast<int64_t>(seq_len)};
        std::vector<Ort::Value> inputs;
        std::vector<const char*> names;
        for (const auto& name : input_names_) {
            std::vector<int64_t>& data =
                name == "input_ids" ? ids : (name == "attention_mask" ? mask : types);
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(*memory_info_, data.data(), data.size(),
                                                              shape.data(), shape.size()));
            names.push_back(name.c_str());
        }

        const char* output_names[] = {output_name_.c_str()};
        auto outputs = session_->Run(Ort::RunOptions{nullptr}, names.data(), inputs.data(), inputs.size(),
                                     output_names, 1);

        const float* out = outputs[0].GetTensorData<float>();
        auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();

        if (out_shape.size() == 2) {
            // Already pooled: (batch, hidden)
            const auto hidden = static_cast<std::size_t>(out_shape[1]);
            for (std::size_t b = 0; b < batch; ++b) {
                result.emplace_back(out + b * hidden, out + (b + 1) * hidden);
            }
        } else if (out_shape.size() == 3) {
            // (batch, tokens, hidden)
            const auto tokens = static_cast<std::size_t>(out_shape[1]);
            const auto hidden = static_cast<std::size_t>(out_shape[2]);
            for (std::size_t b = 0; b < batch; ++b) {
                const float* seq = out + b * tokens * hidden;
                std::vector<float> emb(hidden, 0.0f);
                if (pooling_ == Pooling::Cls) {
                    std::copy(seq, seq + hidden, emb.begin());
                } else {
                    float count = 0.0f;
                    for (std::size_t t = 0; t < tokens; ++t) {
                        if (mask[b * seq_len + t] == 0) continue;
                        for (std::size_t h = 0; h < hidden; ++h) {
                            emb[h] += seq[t * hidden + h];
                        }
                        count += 1.0f;
                    }
                    if (count > 0.0f) {
                        for (float& v : emb) v /= count;
                    }
                }
                result.push_back(std::move(emb));
            }
        } else {
            throw EmbeddingError("Unexpected embedding output rank " + std::to_string(out_shape.size()));
        }
    } catch (const Ort::Exception& e) {
        throw EmbeddingError(std::string("Failed to embed text: ") + e.what());
    }

    for (auto& emb : result) {
        normalize_embedding(emb);
    }
    return result;
}
