#pragma once

#include <stdexcept>
#include <string>
#include <vector>

class EmbeddingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Maps text to fixed-length vectors. Throws EmbeddingError on failure.
class TextEmbedder {
public:
    virtual ~TextEmbedder() = default;

    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;
};
