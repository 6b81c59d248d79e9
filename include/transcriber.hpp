#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

class ModelLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RecognitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class DecodingState {
    Running,
    Finalized,
    Failed,
};

// One streaming decode. Not thread-safe; fed from a single thread.
class SpeechDecoder {
public:
    virtual ~SpeechDecoder() = default;

    virtual DecodingState accept_waveform(const int16_t* data, std::size_t samples) = 0;
    // Text of the last finalized utterance. Throws RecognitionError.
    virtual std::string result() = 0;
};

class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    // Throws RecognitionError if no decoder can be allocated.
    virtual std::unique_ptr<SpeechDecoder> create_decoder(unsigned sample_rate) = 0;
};

// Vosk-backed model, loaded once and shared by every recognition session.
class Transcriber : public SpeechModel {
public:
    // Throws ModelLoadError if the model directory cannot be loaded.
    explicit Transcriber(const std::string& model_path);
    ~Transcriber() override;

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    std::unique_ptr<SpeechDecoder> create_decoder(unsigned sample_rate) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Pulls the "text" member out of a Vosk result document. Missing text is
// empty. Throws RecognitionError if the document is not JSON.
std::string extract_text_field(const std::string& json);
