#include "audio_format.hpp"

#include <sstream>

const char* sample_format_name(SampleFormat format) {
    switch (format) {
    case SampleFormat::I16:
        return "i16";
    case SampleFormat::I32:
        return "i32";
    case SampleFormat::F32:
        return "f32";
    }
    return "unknown";
}

std::size_t sample_size(SampleFormat format) {
    switch (format) {
    case SampleFormat::I16:
        return sizeof(int16_t);
    case SampleFormat::I32:
        return sizeof(int32_t);
    case SampleFormat::F32:
        return sizeof(float);
    }
    return 0;
}

bool operator==(const AudioFormat& a, const AudioFormat& b) {
    return a.format == b.format && a.channels == b.channels && a.sample_rate == b.sample_rate;
}

std::string describe(const AudioFormat& format) {
    std::ostringstream oss;
    oss << sample_format_name(format.format) << ", " << format.channels << "ch, "
        << format.sample_rate << " Hz";
    return oss.str();
}

AudioFormat negotiate_input_format(const DeviceCapabilities& caps, unsigned target_rate) {
    // All SampleFormat values are accepted widths, so only the channel count matters here.
    if (caps.default_format.channels == 1) {
        return caps.default_format;
    }

    for (const auto& range : caps.supported) {
        if (range.channels == 1 && range.supports_rate(target_rate)) {
            AudioFormat format;
            format.format = range.format;
            format.channels = 1;
            format.sample_rate = target_rate;
            return format;
        }
    }

    std::ostringstream oss;
    oss << "No mono input configuration at " << target_rate << " Hz on device '" << caps.name
        << "'";
    throw AudioError(oss.str());
}
