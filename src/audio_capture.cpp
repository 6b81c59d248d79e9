#include "audio_capture.hpp"
#include "logging.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

Subscription::Subscription(Subscription&& other) noexcept : source_(other.source_), id_(other.id_) {
    other.source_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        source_ = other.source_;
        id_ = other.id_;
        other.source_ = nullptr;
    }
    return *this;
}

Subscription::~Subscription() { reset(); }

void Subscription::reset() {
    if (source_) {
        source_->unsubscribe(id_);
        source_ = nullptr;
    }
}

Subscription AudioSource::subscribe(AudioSink* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw AudioError("Audio stream is closed");
    }
    std::size_t id = next_id_++;
    sinks_.push_back(Entry{id, sink});
    return Subscription(this, id);
}

void AudioSource::unsubscribe(std::size_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove_if(sinks_.begin(), sinks_.end(),
                                [id](const Entry& e) { return e.id == id; }),
                 sinks_.end());
}

void AudioSource::dispatch(const AudioChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : sinks_) {
        entry.sink->on_samples(chunk);
    }
}

void AudioSource::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for (const auto& entry : sinks_) {
        entry.sink->on_closed();
    }
    sinks_.clear();
}

#if defined(__linux__)

#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdio>
#include <memory>
#include <sstream>
#include <thread>

namespace {

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

snd_pcm_format_t to_alsa(SampleFormat format) {
    switch (format) {
    case SampleFormat::I16:
        return SND_PCM_FORMAT_S16_LE;
    case SampleFormat::I32:
        return SND_PCM_FORMAT_S32_LE;
    case SampleFormat::F32:
        return SND_PCM_FORMAT_FLOAT_LE;
    }
    return SND_PCM_FORMAT_UNKNOWN;
}

// Owns a snd_pcm_hw_params_t for the duration of a scope.
struct HwParams {
    snd_pcm_hw_params_t* ptr{nullptr};

    HwParams() {
        snd_pcm_hw_params_malloc(&ptr);
        if (!ptr) {
            throw AudioError("Failed to allocate ALSA hw params");
        }
    }
    ~HwParams() { snd_pcm_hw_params_free(ptr); }

    HwParams(const HwParams&) = delete;
    HwParams& operator=(const HwParams&) = delete;
};

constexpr unsigned kMaxQueriedChannels = 8;

} // namespace

struct AudioCapture::Impl {
    Impl(AudioCapture* owner, const AudioConfig& cfg) : owner_(owner), cfg_(cfg) {}
    ~Impl();

    void start(const AudioFormat& format);
    void run();

    AudioCapture* owner_;
    AudioConfig cfg_;
    AudioFormat format_;
    snd_pcm_t* handle_{nullptr};
    std::thread thread_;
    std::atomic<bool> running_{false};
};

AudioCapture::Impl::~Impl() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
}

void AudioCapture::Impl::start(const AudioFormat& format) {
    if (running_) return;

    int err = snd_pcm_open(&handle_, cfg_.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        handle_ = nullptr;
        throw AudioError(alsa_error(err, "snd_pcm_open"));
    }

    {
        HwParams hw;
        snd_pcm_hw_params_any(handle_, hw.ptr);

        err = snd_pcm_hw_params_set_access(handle_, hw.ptr, SND_PCM_ACCESS_RW_INTERLEAVED);
        if (err < 0) {
            throw AudioError(alsa_error(err, "snd_pcm_hw_params_set_access"));
        }

        err = snd_pcm_hw_params_set_format(handle_, hw.ptr, to_alsa(format.format));
        if (err < 0) {
            throw AudioError(alsa_error(err, "snd_pcm_hw_params_set_format"));
        }

        err = snd_pcm_hw_params_set_channels(handle_, hw.ptr, format.channels);
        if (err < 0) {
            throw AudioError(alsa_error(err, "snd_pcm_hw_params_set_channels"));
        }

        unsigned int rate = format.sample_rate;
        err = snd_pcm_hw_params_set_rate_near(handle_, hw.ptr, &rate, nullptr);
        if (err < 0) {
            throw AudioError(alsa_error(err, "snd_pcm_hw_params_set_rate_near"));
        }

        snd_pcm_uframes_t frames = cfg_.frames_per_buffer;
        err = snd_pcm_hw_params_set_period_size_near(handle_, hw.ptr, &frames, nullptr);
        if (err < 0) {
            throw AudioError(alsa_error(err, "snd_pcm_hw_params_set_period_size_near"));
        }
        cfg_.frames_per_buffer = static_cast<unsigned>(frames);

        err = snd_pcm_hw_params(handle_, hw.ptr);
        if (err < 0) {
            throw AudioError(alsa_error(err, "snd_pcm_hw_params"));
        }

        format_ = format;
        if (rate != format.sample_rate) {
            log_warn("Sample rate adjusted to " + std::to_string(rate) + " Hz");
            format_.sample_rate = rate;
        }
    }

    err = snd_pcm_prepare(handle_);
    if (err < 0) {
        throw AudioError(alsa_error(err, "snd_pcm_prepare"));
    }

    log_info("Capturing from '" + cfg_.device + "' (" + describe(format_) + ", " +
             std::to_string(cfg_.frames_per_buffer) + " frames per read)");

    running_ = true;
    thread_ = std::thread([this] { run(); });
}

void AudioCapture::Impl::run() {
    const std::size_t frame_bytes = sample_size(format_.format) * format_.channels;
    std::vector<unsigned char> buffer(static_cast<std::size_t>(cfg_.frames_per_buffer) * frame_bytes);

    while (running_) {
        snd_pcm_sframes_t frames = snd_pcm_readi(handle_, buffer.data(), cfg_.frames_per_buffer);
        if (frames < 0) {
            log_warn(alsa_error(static_cast<int>(frames), "snd_pcm_readi") + ", recovering");
            frames = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
        }
        if (frames < 0) {
            log_error(alsa_error(static_cast<int>(frames), "snd_pcm_readi"));
            break;
        }
        if (frames == 0) continue;

        AudioChunk chunk;
        chunk.format = format_;
        chunk.data = buffer.data();
        chunk.samples = static_cast<std::size_t>(frames) * format_.channels;
        owner_->dispatch(chunk);
    }

    running_ = false;
    owner_->close_all();
}

DeviceCapabilities AudioCapture::query_device(const std::string& device) {
    snd_pcm_t* handle = nullptr;
    int err = snd_pcm_open(&handle, device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        throw AudioError(alsa_error(err, "snd_pcm_open(" + device + ")"));
    }

    std::unique_ptr<snd_pcm_t, int (*)(snd_pcm_t*)> guard(handle, snd_pcm_close);

    DeviceCapabilities caps;
    caps.name = device;

    {
        HwParams any;
        snd_pcm_hw_params_any(handle, any.ptr);

        for (SampleFormat format : {SampleFormat::I16, SampleFormat::I32, SampleFormat::F32}) {
            if (snd_pcm_hw_params_test_format(handle, any.ptr, to_alsa(format)) < 0) continue;

            HwParams with_format;
            snd_pcm_hw_params_copy(with_format.ptr, any.ptr);
            snd_pcm_hw_params_set_format(handle, with_format.ptr, to_alsa(format));

            unsigned min_ch = 0;
            unsigned max_ch = 0;
            snd_pcm_hw_params_get_channels_min(with_format.ptr, &min_ch);
            snd_pcm_hw_params_get_channels_max(with_format.ptr, &max_ch);
            max_ch = std::min(max_ch, kMaxQueriedChannels);

            for (unsigned ch = min_ch; ch <= max_ch; ++ch) {
                HwParams with_channels;
                snd_pcm_hw_params_copy(with_channels.ptr, with_format.ptr);
                if (snd_pcm_hw_params_set_channels(handle, with_channels.ptr, ch) < 0) continue;

                SupportedFormatRange range;
                range.format = format;
                range.channels = ch;
                snd_pcm_hw_params_get_rate_min(with_channels.ptr, &range.min_rate, nullptr);
                snd_pcm_hw_params_get_rate_max(with_channels.ptr, &range.max_rate, nullptr);
                caps.supported.push_back(range);
            }
        }
    }
    guard.reset();

    if (caps.supported.empty()) {
        throw AudioError("Device '" + device + "' supports none of i16, i32, f32 capture");
    }

    const SupportedFormatRange& first = caps.supported.front();
    caps.default_format.format = first.format;
    caps.default_format.channels = first.channels;
    if (first.supports_rate(48000)) {
        caps.default_format.sample_rate = 48000;
    } else if (first.supports_rate(44100)) {
        caps.default_format.sample_rate = 44100;
    } else {
        caps.default_format.sample_rate = first.max_rate;
    }
    return caps;
}

void AudioCapture::list_devices() {
    int card = -1;
    if (snd_card_next(&card) < 0 || card < 0) {
        std::cout << "No ALSA capture devices found.\n";
        return;
    }

    std::cout << "ALSA capture devices (use \"plughw:x,y\"):\n";
    while (card >= 0) {
        snd_ctl_t* ctl = nullptr;
        char card_name[32];
        std::snprintf(card_name, sizeof(card_name), "hw:%d", card);
        if (snd_ctl_open(&ctl, card_name, 0) < 0) {
            snd_card_next(&card);
            continue;
        }

        snd_pcm_info_t* pcm_info = nullptr;
        snd_pcm_info_malloc(&pcm_info);
        if (!pcm_info) {
            std::cout << "  (Failed to allocate pcm_info)\n";
            snd_ctl_close(ctl);
            snd_card_next(&card);
            continue;
        }

        int device = -1;
        while (true) {
            if (snd_ctl_pcm_next_device(ctl, &device) < 0) break;
            if (device < 0) break;

            snd_pcm_info_set_device(pcm_info, device);
            snd_pcm_info_set_subdevice(pcm_info, 0);
            snd_pcm_info_set_stream(pcm_info, SND_PCM_STREAM_CAPTURE);

            if (snd_ctl_pcm_info(ctl, pcm_info) < 0) continue;

            const char* name = snd_pcm_info_get_name(pcm_info);
            std::cout << "- hw:" << card << "," << device;
            if (name) std::cout << " (" << name << ")";
            std::cout << "\n";
        }

        snd_pcm_info_free(pcm_info);
        snd_ctl_close(ctl);
        snd_card_next(&card);
    }
}

#else

struct AudioCapture::Impl {
    Impl(AudioCapture*, const AudioConfig&) {
        throw AudioError("Audio capture not supported on this platform");
    }
    void start(const AudioFormat&) {}
    AudioFormat format_;
};

DeviceCapabilities AudioCapture::query_device(const std::string&) {
    throw AudioError("Audio capture not supported on this platform");
}

void AudioCapture::list_devices() {
    std::cout << "Audio capture not supported on this platform.\n";
}

#endif

AudioCapture::AudioCapture(const AudioConfig& cfg) : impl_(new Impl(this, cfg)) {}

AudioCapture::~AudioCapture() { delete impl_; }

void AudioCapture::start(const AudioFormat& format) { impl_->start(format); }

AudioFormat AudioCapture::format() const { return impl_->format_; }
