#pragma once

#include "audio_capture.hpp"
#include "transcriber.hpp"

#include <chrono>
#include <functional>
#include <string>

struct RecognitionResult {
    enum class Kind {
        Final,      // decoder finalized an utterance
        Failed,     // decoder gave up
        Cancelled,  // timeout reached first
    };

    Kind kind = Kind::Failed;
    std::string text;

    static RecognitionResult final_text(std::string text) { return {Kind::Final, std::move(text)}; }
    static RecognitionResult failed() { return {Kind::Failed, {}}; }
    static RecognitionResult cancelled() { return {Kind::Cancelled, {}}; }
};

const char* recognition_kind_name(RecognitionResult::Kind kind);

// Records one sentence from the shared capture stream. Each recognize() call
// is a fresh session with its own decoder.
class SpeechRecognizer {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultTimeout{20};

    SpeechRecognizer(SpeechModel& model, AudioSource& source,
                     std::chrono::milliseconds timeout = kDefaultTimeout,
                     Clock clock = [] { return std::chrono::steady_clock::now(); });

    // Blocks until the decoder finalizes, fails, or the timeout passes.
    // Throws RecognitionError if no decoder can be created or the capture
    // stream closes mid-session.
    RecognitionResult recognize();

private:
    SpeechModel& model_;
    AudioSource& source_;
    std::chrono::milliseconds timeout_;
    Clock clock_;
};
