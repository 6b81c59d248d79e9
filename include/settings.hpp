#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AssistantSettings {
    std::string device = "default";                     // ALSA capture device
    unsigned frames_per_buffer = 512;                   // frames per capture read
    unsigned target_sample_rate = 16000;                // preferred mono rate
    std::chrono::milliseconds recognition_timeout{20000};
    std::chrono::milliseconds speaking_poll_interval{100};

    std::string wakeword_feature_dir = "openwakeword";  // melspectrogram and embedding models
    float wakeword_threshold = 0.5f;
    int wakeword_refractory_frames = 20;

    int synthesizer_rate = 0;                           // -100..100, 0 is the voice default

    // Defaults overridden by HARK_AUDIO_DEVICE, HARK_FRAMES_PER_BUFFER and
    // HARK_RECOGNITION_TIMEOUT (seconds). Throws ConfigError on bad values.
    static AssistantSettings from_env();
};

// $HARK_CONFIG_DIR, else $HOME/.config/hark. Created if missing. Throws
// ConfigError when neither variable is set.
std::string config_dir();

std::string config_file(const std::string& dir, const std::string& name);
