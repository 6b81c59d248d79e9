#include "wakeword_spotter.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cmath>
#include <exception>

FrameDetector::FrameDetector(WakewordModel& model, const AudioFormat& format,
                             Channel<std::string>::Sender sender)
    : model_(model), format_(format), sender_(std::move(sender)) {
    const double ratio = static_cast<double>(format_.sample_rate) / model_.sample_rate();
    const auto per_channel =
        static_cast<std::size_t>(std::lround(static_cast<double>(model_.samples_per_frame()) * ratio));
    frame_samples_ = per_channel * format_.channels;
}

void FrameDetector::on_samples(const AudioChunk& chunk) {
    append_as_float(chunk, buffer_);
    while (buffer_.size() >= frame_samples_) {
        score_frame(buffer_.data());
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(frame_samples_));
    }
}

void FrameDetector::on_closed() {
    log_warn("Capture stream closed, wakeword detection stopped");
    sender_.close();
}

void FrameDetector::score_frame(const float* samples) {
    const std::size_t frames = frame_samples_ / format_.channels;

    std::vector<float> mono;
    if (format_.channels > 1) {
        mono.resize(frames);
        for (std::size_t i = 0; i < frames; ++i) {
            float sum = 0.0f;
            for (unsigned c = 0; c < format_.channels; ++c) {
                sum += samples[i * format_.channels + c];
            }
            mono[i] = sum / static_cast<float>(format_.channels);
        }
        samples = mono.data();
    }

    std::vector<float> resampled;
    if (frames != model_.samples_per_frame()) {
        resampled = resample_linear(samples, frames, model_.samples_per_frame());
        samples = resampled.data();
    }

    std::optional<std::string> detection;
    try {
        detection = model_.process(samples);
    } catch (const WakewordError& e) {
        log_error(e.what());
        return;
    } catch (const std::exception& e) {
        // Runs on the capture thread, nothing above it can handle this.
        log_error(std::string("Wakeword frame dropped: ") + e.what());
        return;
    }

    if (detection) {
        log_info("Wakeword detected: " + *detection);
        sender_.send(std::move(*detection));
    }
}

WakewordListener::WakewordListener(std::unique_ptr<WakewordModel> model,
                                   std::unique_ptr<FrameDetector> detector,
                                   Channel<std::string>::Receiver receiver, Subscription subscription)
    : model_(std::move(model)),
      detector_(std::move(detector)),
      receiver_(std::move(receiver)),
      subscription_(std::move(subscription)) {}

std::optional<std::string> WakewordListener::listen() { return receiver_.recv(); }

std::size_t WakewordListener::discard_pending() {
    std::size_t dropped = 0;
    while (receiver_.try_recv()) {
        ++dropped;
    }
    return dropped;
}

WakewordSpotter WakewordSpotter::build(const DeviceCapabilities& caps,
                                       std::unique_ptr<WakewordModel> model) {
    AudioFormat format = negotiate_input_format(caps, model->sample_rate());
    log_info("Wakeword input format: " + describe(format));
    return WakewordSpotter(format, std::move(model));
}

WakewordSpotter::WakewordSpotter(const AudioFormat& format, std::unique_ptr<WakewordModel> model)
    : format_(format), model_(std::move(model)) {}

void WakewordSpotter::add_profile(const std::string& name, const std::string& path) {
    if (!model_) {
        throw WakewordError("Wakeword spotter already started");
    }
    model_->add_profile(name, path);
}

WakewordListener WakewordSpotter::start(AudioSource& source) {
    if (!model_) {
        throw WakewordError("Wakeword spotter already started");
    }
    if (model_->profile_count() == 0) {
        throw WakewordError("No wakewords added");
    }

    auto channel = Channel<std::string>::make();
    auto detector = std::make_unique<FrameDetector>(*model_, source.format(), std::move(channel.first));
    Subscription subscription = source.subscribe(detector.get());

    return WakewordListener(std::move(model_), std::move(detector), std::move(channel.second),
                            std::move(subscription));
}
