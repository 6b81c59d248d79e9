#pragma once

#include "audio_capture.hpp"
#include "channel.hpp"
#include "wakeword_model.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

// Cuts the incoming stream into model frames and scores them. Runs on the
// capture thread.
class FrameDetector : public AudioSink {
public:
    FrameDetector(WakewordModel& model, const AudioFormat& format,
                  Channel<std::string>::Sender sender);

    void on_samples(const AudioChunk& chunk) override;
    void on_closed() override;

    // Interleaved device samples that make up one model frame.
    std::size_t frame_samples() const { return frame_samples_; }
    std::size_t buffered_samples() const { return buffer_.size(); }

private:
    void score_frame(const float* samples);

    WakewordModel& model_;
    AudioFormat format_;
    std::size_t frame_samples_;
    std::vector<float> buffer_;
    Channel<std::string>::Sender sender_;
};

class WakewordListener {
public:
    WakewordListener(WakewordListener&&) = default;
    WakewordListener& operator=(WakewordListener&&) = default;

    // Blocks until a wakeword is detected. Empty result means the capture
    // stream is gone and no more detections will come.
    std::optional<std::string> listen();

    // Drops detections already queued without waiting. Returns how many.
    std::size_t discard_pending();

private:
    friend class WakewordSpotter;
    WakewordListener(std::unique_ptr<WakewordModel> model, std::unique_ptr<FrameDetector> detector,
                     Channel<std::string>::Receiver receiver, Subscription subscription);

    std::unique_ptr<WakewordModel> model_;
    std::unique_ptr<FrameDetector> detector_;
    Channel<std::string>::Receiver receiver_;
    Subscription subscription_;
};

class WakewordSpotter {
public:
    // Negotiates a mono format at the model's rate. Throws AudioError if the
    // device offers none.
    static WakewordSpotter build(const DeviceCapabilities& caps, std::unique_ptr<WakewordModel> model);

    WakewordSpotter(const AudioFormat& format, std::unique_ptr<WakewordModel> model);

    void add_profile(const std::string& name, const std::string& path);

    const AudioFormat& format() const { return format_; }

    // Attaches to `source` and starts scoring. Throws WakewordError if no
    // profile was added. The spotter is spent afterwards.
    WakewordListener start(AudioSource& source);

private:
    AudioFormat format_;
    std::unique_ptr<WakewordModel> model_;
};
