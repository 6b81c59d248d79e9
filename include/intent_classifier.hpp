#pragma once

#include "text_embedder.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class IntentError : public std::runtime_error {
public:
    enum class Kind {
        NoIntentsProvided,
        EmptyIntent,
        ScoreTooLow,
    };

    IntentError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Minimum similarity for a match to count.
constexpr float kConfidenceFloor = 0.5f;

// dot(a, b) / (|a| * |b|). NaN when either vector has zero magnitude.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Scan rule for the best match: the current best is replaced unless it is
// strictly greater than the candidate. Ties and NaN go to the later example.
inline bool replaces_best(float best, float candidate) { return !(best > candidate); }

inline bool is_confident(float score) { return score >= kConfidenceFloor; }

// Nearest-example intent lookup over sentence embeddings.
template <typename T>
class IntentClassifier {
public:
    struct Intent {
        T id;
        std::vector<std::string> examples;
    };

    using EmbedderFactory = std::function<std::unique_ptr<TextEmbedder>()>;

    // Embeds every example once. The factory is only called after the intent
    // list has been validated.
    static IntentClassifier build(std::vector<Intent> intents, const EmbedderFactory& make_embedder) {
        if (intents.empty()) {
            throw IntentError(IntentError::Kind::NoIntentsProvided, "No intents provided");
        }
        for (std::size_t i = 0; i < intents.size(); ++i) {
            if (intents[i].examples.empty()) {
                throw IntentError(IntentError::Kind::EmptyIntent,
                                  "Intent #" + std::to_string(i) + " has no examples");
            }
        }

        std::unique_ptr<TextEmbedder> embedder = make_embedder();
        if (!embedder) {
            throw EmbeddingError("Failed to build text embedding model");
        }

        std::vector<Processed> processed;
        processed.reserve(intents.size());
        for (auto& intent : intents) {
            auto vectors = embedder->embed(intent.examples);
            if (vectors.size() != intent.examples.size()) {
                throw EmbeddingError("Embedding model returned " + std::to_string(vectors.size()) +
                                     " vectors for " + std::to_string(intent.examples.size()) +
                                     " examples");
            }
            processed.push_back(Processed{std::move(intent.id), std::move(vectors)});
        }
        return IntentClassifier(std::move(processed), std::move(embedder));
    }

    // Throws EmbeddingError, or IntentError::ScoreTooLow if nothing clears
    // the confidence floor.
    const T& classify(const std::string& text) const {
        auto embedded = embedder_->embed({text});
        if (embedded.empty()) {
            throw EmbeddingError("Embedding model returned no vector for the query");
        }
        const std::vector<float>& target = embedded.front();

        const Processed* best = nullptr;
        float best_score = 0.0f;
        for (const auto& intent : intents_) {
            for (const auto& example : intent.examples) {
                float score = cosine_similarity(example, target);
                if (!best || replaces_best(best_score, score)) {
                    best = &intent;
                    best_score = score;
                }
            }
        }

        if (!best || !is_confident(best_score)) {
            throw IntentError(IntentError::Kind::ScoreTooLow,
                              "Failed to recognize intent, matched none with a high enough score");
        }
        return best->id;
    }

    std::size_t intent_count() const { return intents_.size(); }

private:
    struct Processed {
        T id;
        std::vector<std::vector<float>> examples;
    };

    IntentClassifier(std::vector<Processed> intents, std::unique_ptr<TextEmbedder> embedder)
        : intents_(std::move(intents)), embedder_(std::move(embedder)) {}

    std::vector<Processed> intents_;
    std::unique_ptr<TextEmbedder> embedder_;
};
