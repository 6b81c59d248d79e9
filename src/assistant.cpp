#include "assistant.hpp"

CycleError::CycleError(std::string wakeword, Kind kind, const std::string& detail)
    : std::runtime_error(std::string(cycle_error_kind_name(kind)) + " after wakeword '" + wakeword +
                         "': " + detail),
      wakeword_(std::move(wakeword)),
      kind_(kind) {}

const char* cycle_error_kind_name(CycleError::Kind kind) {
    switch (kind) {
    case CycleError::Kind::RecognitionInit:
        return "speech recognition init failed";
    case CycleError::Kind::RecognitionFailed:
        return "speech recognition failed";
    case CycleError::Kind::RecognitionTimeout:
        return "speech recognition timed out";
    case CycleError::Kind::EmbeddingFailed:
        return "text embedding failed";
    case CycleError::Kind::ScoreTooLow:
        return "no confident intent";
    case CycleError::Kind::SynthesizerUnavailable:
        return "synthesizer unavailable";
    }
    return "unknown";
}
