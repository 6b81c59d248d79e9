#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

enum class SampleFormat {
    I16,
    I32,
    F32,
};

const char* sample_format_name(SampleFormat format);
std::size_t sample_size(SampleFormat format);

struct AudioFormat {
    SampleFormat format = SampleFormat::I16;
    unsigned channels = 1;
    unsigned sample_rate = 16000;
};

bool operator==(const AudioFormat& a, const AudioFormat& b);
std::string describe(const AudioFormat& format);

// One format/channel combination a device accepts over a range of rates.
struct SupportedFormatRange {
    SampleFormat format = SampleFormat::I16;
    unsigned channels = 1;
    unsigned min_rate = 0;
    unsigned max_rate = 0;

    bool supports_rate(unsigned rate) const { return min_rate <= rate && rate <= max_rate; }
};

struct DeviceCapabilities {
    std::string name;
    AudioFormat default_format;
    std::vector<SupportedFormatRange> supported;
};

class AudioError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Picks the device default when it is already mono, otherwise the first mono
// range that covers target_rate. Throws AudioError when nothing fits.
AudioFormat negotiate_input_format(const DeviceCapabilities& caps, unsigned target_rate);

// Non-owning view over one delivery of interleaved samples.
struct AudioChunk {
    AudioFormat format;
    const void* data = nullptr;
    std::size_t samples = 0;

    template <typename S>
    const S* as() const {
        return static_cast<const S*>(data);
    }
};
