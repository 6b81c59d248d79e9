#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace {

float to_float(int16_t s) { return static_cast<float>(s) / 32768.0f; }
float to_float(int32_t s) { return static_cast<float>(static_cast<double>(s) / 2147483648.0); }
float to_float(float s) { return s; }

int16_t to_pcm16(int16_t s) { return s; }
int16_t to_pcm16(int32_t s) { return static_cast<int16_t>(s >> 16); }
int16_t to_pcm16(float s) {
    const float clamped = std::max(-1.0f, std::min(1.0f, s));
    return static_cast<int16_t>(std::lround(clamped * 32767.0f));
}

template <typename S, typename Out>
void append_converted(const AudioChunk& chunk, std::vector<Out>& out) {
    const S* samples = chunk.as<S>();
    out.reserve(out.size() + chunk.samples);
    for (std::size_t i = 0; i < chunk.samples; ++i) {
        if constexpr (std::is_same<Out, float>::value) {
            out.push_back(to_float(samples[i]));
        } else {
            out.push_back(to_pcm16(samples[i]));
        }
    }
}

template <typename Out>
void append_chunk(const AudioChunk& chunk, std::vector<Out>& out) {
    switch (chunk.format.format) {
    case SampleFormat::I16:
        append_converted<int16_t>(chunk, out);
        break;
    case SampleFormat::I32:
        append_converted<int32_t>(chunk, out);
        break;
    case SampleFormat::F32:
        append_converted<float>(chunk, out);
        break;
    }
}

} // namespace

void append_as_float(const AudioChunk& chunk, std::vector<float>& out) { append_chunk(chunk, out); }

void append_as_pcm16(const AudioChunk& chunk, std::vector<int16_t>& out) { append_chunk(chunk, out); }

std::vector<float> resample_linear(const float* in, std::size_t in_len, std::size_t out_len) {
    std::vector<float> out(out_len, 0.0f);
    if (in_len == 0 || out_len == 0) return out;
    if (in_len == out_len) {
        std::copy(in, in + in_len, out.begin());
        return out;
    }

    const double step = static_cast<double>(in_len) / static_cast<double>(out_len);
    for (std::size_t i = 0; i < out_len; ++i) {
        double pos = static_cast<double>(i) * step;
        std::size_t idx = static_cast<std::size_t>(pos);
        if (idx + 1 >= in_len) {
            out[i] = in[in_len - 1];
            continue;
        }
        double frac = pos - static_cast<double>(idx);
        out[i] = static_cast<float>(in[idx] * (1.0 - frac) + in[idx + 1] * frac);
    }
    return out;
}
