#pragma once

#include "speech_synthesizer.hpp"

#include <memory>

// Speech output through the speech-dispatcher daemon. Only one instance may
// exist at a time since libspeechd callbacks carry no user data.
class SpeechDispatcherSynthesizer : public SpeechSynthesizer {
public:
    // Throws SynthesizerError if the daemon cannot be reached or another
    // instance is alive.
    explicit SpeechDispatcherSynthesizer(int rate = 0);
    ~SpeechDispatcherSynthesizer() override;

    SpeechDispatcherSynthesizer(const SpeechDispatcherSynthesizer&) = delete;
    SpeechDispatcherSynthesizer& operator=(const SpeechDispatcherSynthesizer&) = delete;

    void speak(const std::string& text) override;
    bool is_speaking() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
