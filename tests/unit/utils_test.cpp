#include <cassert>
#include <cmath>
#include <cstdint>
#include <vector>
#include "utils.hpp"

namespace {

AudioChunk chunk_of(SampleFormat format, const void* data, std::size_t samples) {
    AudioChunk c;
    c.format.format = format;
    c.data = data;
    c.samples = samples;
    return c;
}

} // namespace

int main() {
    {
        std::vector<int16_t> in{0, 16384, -32768};
        std::vector<float> out{9.0f};
        append_as_float(chunk_of(SampleFormat::I16, in.data(), in.size()), out);
        assert(out.size() == 4);
        assert(out[0] == 9.0f);
        assert(out[1] == 0.0f);
        assert(out[2] == 0.5f);
        assert(out[3] == -1.0f);
    }

    {
        std::vector<float> in{1.5f, -1.0f, 0.0f};
        std::vector<int16_t> out;
        append_as_pcm16(chunk_of(SampleFormat::F32, in.data(), in.size()), out);
        assert(out.size() == 3);
        assert(out[0] == 32767);
        assert(out[1] == -32767);
        assert(out[2] == 0);
    }

    {
        std::vector<int32_t> in{0x7fff0000, -0x40000000};
        std::vector<int16_t> out;
        append_as_pcm16(chunk_of(SampleFormat::I32, in.data(), in.size()), out);
        assert(out[0] == 32767);
        assert(out[1] == -16384);
    }

    {
        std::vector<float> in{0.0f, 1.0f};
        std::vector<float> up = resample_linear(in.data(), in.size(), 4);
        assert(up.size() == 4);
        assert(up[0] == 0.0f);
        assert(std::fabs(up[1] - 0.5f) < 1e-6f);
        assert(up[3] == 1.0f);

        std::vector<float> same = resample_linear(in.data(), in.size(), 2);
        assert(same == in);

        assert(resample_linear(nullptr, 0, 3) == std::vector<float>(3, 0.0f));
    }
    return 0;
}
