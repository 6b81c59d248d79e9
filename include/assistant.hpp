#pragma once

#include "audio_capture.hpp"
#include "embedding_model.hpp"
#include "intent_classifier.hpp"
#include "logging.hpp"
#include "openwakeword_model.hpp"
#include "settings.hpp"
#include "speech_dispatcher.hpp"
#include "speech_recognizer.hpp"
#include "speech_synthesizer.hpp"
#include "transcriber.hpp"
#include "wakeword_spotter.hpp"

#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// A cycle failed after its wakeword was received. The assistant stays usable.
class CycleError : public std::runtime_error {
public:
    enum class Kind {
        RecognitionInit,
        RecognitionFailed,
        RecognitionTimeout,
        EmbeddingFailed,
        ScoreTooLow,
        SynthesizerUnavailable,
    };

    CycleError(std::string wakeword, Kind kind, const std::string& detail);

    const std::string& wakeword() const { return wakeword_; }
    Kind kind() const { return kind_; }

private:
    std::string wakeword_;
    Kind kind_;
};

const char* cycle_error_kind_name(CycleError::Kind kind);

// The wakeword stream disconnected. No further cycles are possible.
class WakewordStreamClosed : public std::runtime_error {
public:
    WakewordStreamClosed() : std::runtime_error("Wakeword stream closed") {}
};

template <typename T>
struct AssistantQuery {
    std::string wakeword;
    const T* intent = nullptr;  // null for wakewords that do not listen
};

template <typename T>
class Assistant {
public:
    // Waits for the next wakeword and processes it. Throws CycleError for a
    // failed cycle and WakewordStreamClosed once capture has stopped.
    AssistantQuery<T> listen() {
        for (;;) {
            std::optional<std::string> wakeword = listener_.listen();
            if (!wakeword) {
                throw WakewordStreamClosed();
            }

            if (speaking(*wakeword)) {
                log_info("Wakeword '" + *wakeword + "' arrived while speaking, ignored");
                try {
                    finish_speaking();
                } catch (const SynthesizerError& e) {
                    throw CycleError(*wakeword, CycleError::Kind::SynthesizerUnavailable, e.what());
                }
                drop_stale_wakewords();
                continue;
            }

            if (!listen_wakewords_.count(*wakeword)) {
                return AssistantQuery<T>{std::move(*wakeword), nullptr};
            }

            // Only wakewords spoken after this cycle may start the next one.
            AssistantQuery<T> query;
            try {
                query = process(std::move(*wakeword));
            } catch (const CycleError&) {
                drop_stale_wakewords();
                throw;
            }
            drop_stale_wakewords();
            return query;
        }
    }

    // Interrupts any current utterance. Throws SynthesizerError.
    void speak(const std::string& text) { synthesizer_->speak(text); }

    // Blocks until the synthesizer falls silent. Throws SynthesizerError.
    void finish_speaking() {
        while (synthesizer_->is_speaking()) {
            std::this_thread::sleep_for(settings_.speaking_poll_interval);
        }
    }

private:
    template <typename>
    friend class AssistantConfig;

    Assistant(std::unique_ptr<AudioSource> source, std::unique_ptr<SpeechModel> speech_model,
              std::unique_ptr<SpeechSynthesizer> synthesizer, IntentClassifier<T> classifier,
              WakewordListener listener, std::set<std::string> listen_wakewords,
              const AssistantSettings& settings)
        : source_(std::move(source)),
          speech_model_(std::move(speech_model)),
          synthesizer_(std::move(synthesizer)),
          classifier_(std::move(classifier)),
          listener_(std::move(listener)),
          listen_wakewords_(std::move(listen_wakewords)),
          settings_(settings) {}

    void drop_stale_wakewords() {
        std::size_t dropped = listener_.discard_pending();
        if (dropped > 0) {
            log_info("Ignored " + std::to_string(dropped) + " wakeword(s) heard while busy");
        }
    }

    bool speaking(const std::string& wakeword) {
        try {
            return synthesizer_->is_speaking();
        } catch (const SynthesizerError& e) {
            throw CycleError(wakeword, CycleError::Kind::SynthesizerUnavailable, e.what());
        }
    }

    AssistantQuery<T> process(std::string wakeword) {
        log_info("Wakeword '" + wakeword + "', listening for a command");

        SpeechRecognizer recognizer(*speech_model_, *source_, settings_.recognition_timeout);
        RecognitionResult result;
        try {
            result = recognizer.recognize();
        } catch (const RecognitionError& e) {
            throw CycleError(wakeword, CycleError::Kind::RecognitionInit, e.what());
        }

        switch (result.kind) {
        case RecognitionResult::Kind::Final:
            break;
        case RecognitionResult::Kind::Failed:
            throw CycleError(wakeword, CycleError::Kind::RecognitionFailed, "Failed to recognize speech");
        case RecognitionResult::Kind::Cancelled:
            throw CycleError(wakeword, CycleError::Kind::RecognitionTimeout, "Speech recognition timed out");
        }

        try {
            const T& intent = classifier_.classify(result.text);
            return AssistantQuery<T>{std::move(wakeword), &intent};
        } catch (const IntentError& e) {
            throw CycleError(wakeword, CycleError::Kind::ScoreTooLow, e.what());
        } catch (const EmbeddingError& e) {
            throw CycleError(wakeword, CycleError::Kind::EmbeddingFailed, e.what());
        }
    }

    // The listener is declared after the source so its subscription is
    // released before the stream is torn down.
    std::unique_ptr<AudioSource> source_;
    std::unique_ptr<SpeechModel> speech_model_;
    std::unique_ptr<SpeechSynthesizer> synthesizer_;
    IntentClassifier<T> classifier_;
    WakewordListener listener_;
    std::set<std::string> listen_wakewords_;
    AssistantSettings settings_;
};

template <typename T>
class AssistantConfig {
public:
    using EmbedderFactory = typename IntentClassifier<T>::EmbedderFactory;

    // Opens nothing yet: queries the device, loads the speech and wakeword
    // feature models and connects to the synthesizer. Throws AudioError,
    // ModelLoadError, WakewordError or SynthesizerError.
    static AssistantConfig build(const std::string& stt_model_path, EmbeddingModelSource embedding,
                                 const AssistantSettings& settings = AssistantSettings()) {
        AudioConfig audio;
        audio.device = settings.device;
        audio.frames_per_buffer = settings.frames_per_buffer;

        DeviceCapabilities caps = AudioCapture::query_device(settings.device);
        AudioFormat format = negotiate_input_format(caps, settings.target_sample_rate);
        log_info("Input format for '" + caps.name + "': " + describe(format));

        OpenWakewordModel::Config wakeword;
        wakeword.melspectrogram_path = config_file(settings.wakeword_feature_dir, "melspectrogram.onnx");
        wakeword.embedding_path = config_file(settings.wakeword_feature_dir, "embedding_model.onnx");
        wakeword.threshold = settings.wakeword_threshold;
        wakeword.refractory_frames = settings.wakeword_refractory_frames;

        WakewordSpotter spotter(format, std::make_unique<OpenWakewordModel>(wakeword));
        auto speech_model = std::make_unique<Transcriber>(stt_model_path);
        auto synthesizer = std::make_unique<SpeechDispatcherSynthesizer>(settings.synthesizer_rate);

        EmbedderFactory make_embedder = [embedding = std::move(embedding)] {
            return make_text_embedder(embedding);
        };
        return AssistantConfig(std::make_unique<AudioCapture>(audio), std::move(spotter),
                               std::move(speech_model), std::move(synthesizer), std::move(make_embedder),
                               settings);
    }

    AssistantConfig(std::unique_ptr<AudioSource> source, WakewordSpotter spotter,
                    std::unique_ptr<SpeechModel> speech_model,
                    std::unique_ptr<SpeechSynthesizer> synthesizer, EmbedderFactory make_embedder,
                    const AssistantSettings& settings = AssistantSettings())
        : source_(std::move(source)),
          spotter_(std::move(spotter)),
          speech_model_(std::move(speech_model)),
          synthesizer_(std::move(synthesizer)),
          make_embedder_(std::move(make_embedder)),
          settings_(settings) {}

    // Throws WakewordError. With `listen` the wakeword is followed by speech
    // recognition, otherwise it is reported bare.
    void add_wakeword_from_file(const std::string& name, const std::string& file, bool listen) {
        spotter_.add_profile(name, file);
        if (listen) {
            listen_wakewords_.insert(name);
        }
    }

    void add_intent(T id, std::vector<std::string> examples) {
        intents_.push_back(typename IntentClassifier<T>::Intent{std::move(id), std::move(examples)});
    }

    // Builds the classifier, then opens the stream and starts wakeword
    // detection. Throws IntentError, EmbeddingError, WakewordError or
    // AudioError. The config is spent afterwards.
    Assistant<T> start() {
        IntentClassifier<T> classifier = IntentClassifier<T>::build(std::move(intents_), make_embedder_);
        log_info("Intent classifier ready with " + std::to_string(classifier.intent_count()) + " intents");

        source_->start(spotter_.format());
        WakewordListener listener = spotter_.start(*source_);
        log_info("Listening for wakewords");

        return Assistant<T>(std::move(source_), std::move(speech_model_), std::move(synthesizer_),
                            std::move(classifier), std::move(listener), std::move(listen_wakewords_),
                            settings_);
    }

private:
    std::unique_ptr<AudioSource> source_;
    WakewordSpotter spotter_;
    std::unique_ptr<SpeechModel> speech_model_;
    std::unique_ptr<SpeechSynthesizer> synthesizer_;
    EmbedderFactory make_embedder_;
    std::vector<typename IntentClassifier<T>::Intent> intents_;
    std::set<std::string> listen_wakewords_;
    AssistantSettings settings_;
};
