#pragma once

#include "audio_format.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Receives chunks on the capture thread. Implementations must not block for
// long and must not unsubscribe themselves from inside these calls.
class AudioSink {
public:
    virtual ~AudioSink() = default;

    virtual void on_samples(const AudioChunk& chunk) = 0;
    // The stream died; no further chunks will arrive.
    virtual void on_closed() = 0;
};

class AudioSource;

// Detaches its sink on destruction. Once the destructor returns the sink
// will not be called again.
class Subscription {
public:
    Subscription() = default;
    Subscription(AudioSource* source, std::size_t id) : source_(source), id_(id) {}
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    ~Subscription();

    void reset();

private:
    AudioSource* source_{nullptr};
    std::size_t id_{0};
};

// A live stream shared by any number of sinks.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    // Opens the stream at `format`. Throws AudioError on failure.
    virtual void start(const AudioFormat& format) = 0;
    virtual AudioFormat format() const = 0;

    // Throws AudioError if the stream has already closed.
    Subscription subscribe(AudioSink* sink);

protected:
    // Calls every current sink. Intended for the thread that owns the stream.
    void dispatch(const AudioChunk& chunk);
    void close_all();

private:
    friend class Subscription;
    void unsubscribe(std::size_t id);

    struct Entry {
        std::size_t id;
        AudioSink* sink;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> sinks_;
    std::size_t next_id_{1};
    bool closed_{false};
};

struct AudioConfig {
    std::string device = "default";        // ALSA device name or default input
    unsigned frames_per_buffer = 512;      // frames per capture read
};

class AudioCapture : public AudioSource {
public:
    explicit AudioCapture(const AudioConfig& cfg);
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    // Opens the device at `format` and starts the capture thread.
    void start(const AudioFormat& format) override;
    AudioFormat format() const override;

    static DeviceCapabilities query_device(const std::string& device);
    static void list_devices();

private:
    struct Impl;
    Impl* impl_;
};
