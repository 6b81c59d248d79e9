#include "openwakeword_model.hpp"
#include "logging.hpp"

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <fstream>

namespace {

constexpr std::size_t kFrameSamples = 1280;    // 80 ms at 16 kHz
constexpr unsigned kSampleRate = 16000;
constexpr std::size_t kContextSamples = 160 * 3;
constexpr std::size_t kMelBins = 32;
constexpr std::size_t kMelWindow = 76;
constexpr std::size_t kMaxMelFrames = 970;
constexpr std::size_t kEmbeddingDim = 96;
constexpr std::size_t kMaxEmbeddings = 120;
constexpr int64_t kDefaultClassifierWindow = 16;

std::string input_name(Ort::Session& session, std::size_t index) {
    Ort::AllocatorWithDefaultOptions allocator;
    return session.GetInputNameAllocated(index, allocator).get();
}

std::string output_name(Ort::Session& session, std::size_t index) {
    Ort::AllocatorWithDefaultOptions allocator;
    return session.GetOutputNameAllocated(index, allocator).get();
}

// Runs a single-input single-output session and returns the flattened output.
std::vector<float> run_single(Ort::Session& session, const Ort::MemoryInfo& memory_info,
                              const std::string& in_name, const std::string& out_name,
                              std::vector<float>& input, const std::vector<int64_t>& shape) {
    Ort::Value tensor = Ort::Value::CreateTensor<float>(memory_info, input.data(), input.size(),
                                                        shape.data(), shape.size());
    const char* in_names[] = {in_name.c_str()};
    const char* out_names[] = {out_name.c_str()};
    auto outputs = session.Run(Ort::RunOptions{nullptr}, in_names, &tensor, 1, out_names, 1);

    const auto info = outputs.front().GetTensorTypeAndShapeInfo();
    const float* data = outputs.front().GetTensorData<float>();
    return std::vector<float>(data, data + info.GetElementCount());
}

} // namespace

struct OpenWakewordModel::Profile {
    std::string name;
    std::unique_ptr<Ort::Session> session;
    std::string input_name;
    std::string output_name;
    std::size_t window = kDefaultClassifierWindow;
    int cooldown = 0;
};

OpenWakewordModel::OpenWakewordModel(const Config& config) : config_(config) {
    try {
        env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "hark-wakeword");
        options_ = std::make_unique<Ort::SessionOptions>();
        options_->SetIntraOpNumThreads(config_.threads);
        options_->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        memory_info_ = std::make_unique<Ort::MemoryInfo>(
            Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault));

        mel_session_ = std::make_unique<Ort::Session>(*env_, config_.melspectrogram_path.c_str(), *options_);
        emb_session_ = std::make_unique<Ort::Session>(*env_, config_.embedding_path.c_str(), *options_);
    } catch (const Ort::Exception& e) {
        throw WakewordError(std::string("Failed to load openWakeWord models: ") + e.what());
    }

    // openWakeWord starts from a full window of ones.
    for (std::size_t i = 0; i < kMelWindow; ++i) {
        mels_.emplace_back(kMelBins, 1.0f);
    }
    log_info("Loaded openWakeWord feature models from " + config_.melspectrogram_path + " and " +
             config_.embedding_path);
}

OpenWakewordModel::~OpenWakewordModel() = default;

std::size_t OpenWakewordModel::samples_per_frame() const { return kFrameSamples; }

unsigned OpenWakewordModel::sample_rate() const { return kSampleRate; }

void OpenWakewordModel::add_profile(const std::string& name, const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw WakewordError("Failed to add wakeword '" + name + "': cannot read " + path);
    }

    auto profile = std::make_unique<Profile>();
    profile->name = name;
    try {
        profile->session = std::make_unique<Ort::Session>(*env_, path.c_str(), *options_);
        profile->input_name = input_name(*profile->session, 0);
        profile->output_name = output_name(*profile->session, 0);

        auto shape = profile->session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() >= 2 && shape[1] > 0) {
            profile->window = static_cast<std::size_t>(shape[1]);
        }
    } catch (const Ort::Exception& e) {
        throw WakewordError("Failed to add wakeword '" + name + "': " + e.what());
    }

    log_info("Added wakeword '" + name + "' (" + std::to_string(profile->window) +
             " embeddings per score)");
    profiles_.push_back(std::move(profile));
}

void OpenWakewordModel::push_mels(const std::vector<float>& audio) {
    std::vector<float> input = audio;
    std::vector<int64_t> shape{1, static_cast<int64_t>(input.size())};
    std::vector<float> out = run_single(*mel_session_, *memory_info_, input_name(*mel_session_, 0),
                                        output_name(*mel_session_, 0), input, shape);

    const std::size_t frames = out.size() / kMelBins;
    for (std::size_t f = 0; f < frames; ++f) {
        std::vector<float> mel(kMelBins);
        for (std::size_t b = 0; b < kMelBins; ++b) {
            // Scaling expected by the speech embedding model.
            mel[b] = out[f * kMelBins + b] / 10.0f + 2.0f;
        }
        mels_.push_back(std::move(mel));
    }
    while (mels_.size() > kMaxMelFrames) {
        mels_.pop_front();
    }
}

void OpenWakewordModel::push_embedding() {
    if (mels_.size() < kMelWindow) return;

    std::vector<float> window;
    window.reserve(kMelWindow * kMelBins);
    for (auto it = mels_.end() - kMelWindow; it != mels_.end(); ++it) {
        window.insert(window.end(), it->begin(), it->end());
    }

    std::vector<int64_t> shape{1, static_cast<int64_t>(kMelWindow), static_cast<int64_t>(kMelBins), 1};
    std::vector<float> emb = run_single(*emb_session_, *memory_info_, input_name(*emb_session_, 0),
                                        output_name(*emb_session_, 0), window, shape);
    emb.resize(kEmbeddingDim, 0.0f);

    embeddings_.push_back(std::move(emb));
    while (embeddings_.size() > kMaxEmbeddings) {
        embeddings_.pop_front();
    }
}

float OpenWakewordModel::score(Profile& profile) {
    std::vector<float> input;
    input.reserve(profile.window * kEmbeddingDim);
    for (auto it = embeddings_.end() - static_cast<std::ptrdiff_t>(profile.window); it != embeddings_.end(); ++it) {
        input.insert(input.end(), it->begin(), it->end());
    }

    std::vector<int64_t> shape{1, static_cast<int64_t>(profile.window), static_cast<int64_t>(kEmbeddingDim)};
    std::vector<float> out = run_single(*profile.session, *memory_info_, profile.input_name,
                                        profile.output_name, input, shape);
    return out.empty() ? 0.0f : out.front();
}

std::optional<std::string> OpenWakewordModel::process(const float* frame) {
    // The feature models expect int16-scaled floats.
    std::vector<float> audio;
    audio.reserve(context_.size() + kFrameSamples);
    audio.insert(audio.end(), context_.begin(), context_.end());
    for (std::size_t i = 0; i < kFrameSamples; ++i) {
        audio.push_back(frame[i] * 32767.0f);
    }
    context_.assign(audio.end() - kContextSamples, audio.end());

    Profile* best = nullptr;
    float best_score = 0.0f;
    try {
        push_mels(audio);
        push_embedding();

        for (auto& profile : profiles_) {
            if (profile->cooldown > 0) {
                --profile->cooldown;
                continue;
            }
            if (embeddings_.size() < profile->window) continue;

            float s = score(*profile);
            if (s >= config_.threshold && (!best || s > best_score)) {
                best = profile.get();
                best_score = s;
            }
        }
    } catch (const Ort::Exception& e) {
        throw WakewordError(std::string("Wakeword scoring failed: ") + e.what());
    }

    if (!best) return std::nullopt;
    best->cooldown = config_.refractory_frames;
    return best->name;
}
