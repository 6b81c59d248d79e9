#include "intent_classifier.hpp"

#include <algorithm>
#include <cmath>

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    const std::size_t n = std::min(a.size(), b.size());
    float dot = 0.0f;
    for (std::size_t i = 0; i < n; ++i) {
        dot += a[i] * b[i];
    }

    float mag_a = 0.0f;
    for (float x : a) mag_a += x * x;
    float mag_b = 0.0f;
    for (float x : b) mag_b += x * x;

    return dot / (std::sqrt(mag_a) * std::sqrt(mag_b));
}
