#pragma once

#include "audio_format.hpp"

#include <cstdint>
#include <vector>

// Appends the chunk's samples scaled to [-1, 1].
void append_as_float(const AudioChunk& chunk, std::vector<float>& out);

// Appends the chunk's samples as 16-bit PCM.
void append_as_pcm16(const AudioChunk& chunk, std::vector<int16_t>& out);

// Linear interpolation of `in` onto `out_len` evenly spaced points.
std::vector<float> resample_linear(const float* in, std::size_t in_len, std::size_t out_len);
