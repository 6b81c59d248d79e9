#include "transcriber.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>
#include <vosk_api.h>

#include <string>

std::string extract_text_field(const std::string& json) {
    try {
        return nlohmann::json::parse(json).value("text", std::string());
    } catch (const nlohmann::json::exception& e) {
        throw RecognitionError(std::string("Malformed recognizer result: ") + e.what());
    }
}

namespace {

class VoskDecoder : public SpeechDecoder {
public:
    explicit VoskDecoder(VoskRecognizer* recognizer) : recognizer_(recognizer) {}

    ~VoskDecoder() override {
        if (recognizer_) {
            vosk_recognizer_free(recognizer_);
            recognizer_ = nullptr;
        }
    }

    VoskDecoder(const VoskDecoder&) = delete;
    VoskDecoder& operator=(const VoskDecoder&) = delete;

    DecodingState accept_waveform(const int16_t* data, std::size_t samples) override {
        int rc = vosk_recognizer_accept_waveform_s(recognizer_, reinterpret_cast<const short*>(data),
                                                   static_cast<int>(samples));
        if (rc < 0) return DecodingState::Failed;
        if (rc > 0) return DecodingState::Finalized;
        return DecodingState::Running;
    }

    std::string result() override {
        const char* raw = vosk_recognizer_result(recognizer_);
        if (!raw) {
            throw RecognitionError("Vosk returned no result");
        }
        return extract_text_field(raw);
    }

private:
    VoskRecognizer* recognizer_{nullptr};
};

} // namespace

struct Transcriber::Impl {
    VoskModel* model{nullptr};

    explicit Impl(const std::string& model_path) {
        vosk_set_log_level(-1);
        model = vosk_model_new(model_path.c_str());
        if (!model) {
            throw ModelLoadError("Failed to load Vosk model at " + model_path);
        }
    }

    ~Impl() {
        if (model) {
            vosk_model_free(model);
            model = nullptr;
        }
    }
};

Transcriber::Transcriber(const std::string& model_path)
    : impl_(std::make_unique<Impl>(model_path)) {
    log_info("Loaded speech model: " + model_path);
}

Transcriber::~Transcriber() = default;

std::unique_ptr<SpeechDecoder> Transcriber::create_decoder(unsigned sample_rate) {
    VoskRecognizer* recognizer = vosk_recognizer_new(impl_->model, static_cast<float>(sample_rate));
    if (!recognizer) {
        throw RecognitionError("Failed to create Vosk recognizer");
    }
    vosk_recognizer_set_max_alternatives(recognizer, 0);
    vosk_recognizer_set_partial_words(recognizer, false);
    return std::make_unique<VoskDecoder>(recognizer);
}
