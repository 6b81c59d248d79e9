#include <cassert>
#include <string>
#include "audio_format.hpp"

namespace {

DeviceCapabilities stereo_device() {
    DeviceCapabilities caps;
    caps.name = "test";
    caps.default_format.format = SampleFormat::I16;
    caps.default_format.channels = 2;
    caps.default_format.sample_rate = 48000;
    caps.supported.push_back(SupportedFormatRange{SampleFormat::I16, 2, 8000, 96000});
    return caps;
}

} // namespace

int main() {
    // Mono default is used as is, whatever its rate.
    {
        DeviceCapabilities caps;
        caps.default_format.format = SampleFormat::F32;
        caps.default_format.channels = 1;
        caps.default_format.sample_rate = 44100;
        AudioFormat f = negotiate_input_format(caps, 16000);
        assert(f == caps.default_format);
    }

    // Stereo default falls back to the first mono range covering 16 kHz.
    {
        DeviceCapabilities caps = stereo_device();
        caps.supported.push_back(SupportedFormatRange{SampleFormat::I32, 1, 22050, 48000});
        caps.supported.push_back(SupportedFormatRange{SampleFormat::I32, 1, 8000, 48000});
        caps.supported.push_back(SupportedFormatRange{SampleFormat::F32, 1, 8000, 48000});
        AudioFormat f = negotiate_input_format(caps, 16000);
        assert(f.format == SampleFormat::I32);
        assert(f.channels == 1);
        assert(f.sample_rate == 16000);
    }

    // No mono option at the target rate.
    {
        DeviceCapabilities caps = stereo_device();
        caps.supported.push_back(SupportedFormatRange{SampleFormat::I16, 1, 44100, 48000});
        bool threw = false;
        try {
            negotiate_input_format(caps, 16000);
        } catch (const AudioError& e) {
            threw = std::string(e.what()).find("test") != std::string::npos;
        }
        assert(threw);
    }

    assert(describe(AudioFormat{SampleFormat::F32, 2, 48000}) == "f32, 2ch, 48000 Hz");
    assert(sample_size(SampleFormat::I32) == 4);
    return 0;
}
