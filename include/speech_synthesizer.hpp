#pragma once

#include <stdexcept>
#include <string>

class SynthesizerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    // Interrupts anything currently being spoken.
    virtual void speak(const std::string& text) = 0;
    virtual bool is_speaking() = 0;
};
