#pragma once

#include "wakeword_model.hpp"

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace Ort {
struct Env;
struct Session;
struct SessionOptions;
struct MemoryInfo;
}

// openWakeWord pipeline: melspectrogram -> speech embedding -> one
// classifier per profile.
class OpenWakewordModel : public WakewordModel {
public:
    struct Config {
        std::string melspectrogram_path = "openwakeword/melspectrogram.onnx";
        std::string embedding_path = "openwakeword/embedding_model.onnx";
        float threshold = 0.5f;
        int refractory_frames = 20;   // frames ignored after a detection
        int threads = 1;
    };

    explicit OpenWakewordModel(const Config& config);
    ~OpenWakewordModel() override;

    OpenWakewordModel(const OpenWakewordModel&) = delete;
    OpenWakewordModel& operator=(const OpenWakewordModel&) = delete;

    std::size_t samples_per_frame() const override;
    unsigned sample_rate() const override;

    void add_profile(const std::string& name, const std::string& path) override;
    std::size_t profile_count() const override { return profiles_.size(); }

    std::optional<std::string> process(const float* frame) override;

private:
    struct Profile;

    void push_mels(const std::vector<float>& audio);
    void push_embedding();
    float score(Profile& profile);

    Config config_;
    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::SessionOptions> options_;
    std::unique_ptr<Ort::MemoryInfo> memory_info_;
    std::unique_ptr<Ort::Session> mel_session_;
    std::unique_ptr<Ort::Session> emb_session_;
    std::vector<std::unique_ptr<Profile>> profiles_;

    std::vector<float> context_;                 // tail of the previous frame
    std::deque<std::vector<float>> mels_;        // each entry is one 32-bin frame
    std::deque<std::vector<float>> embeddings_;  // each entry is one 96-dim vector
};
