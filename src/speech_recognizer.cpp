#include "speech_recognizer.hpp"
#include "channel.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <memory>
#include <vector>

const char* recognition_kind_name(RecognitionResult::Kind kind) {
    switch (kind) {
    case RecognitionResult::Kind::Final:
        return "final";
    case RecognitionResult::Kind::Failed:
        return "failed";
    case RecognitionResult::Kind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

namespace {

// Capture-thread side of one session. Sends exactly one outcome, then ignores
// anything still in flight until the subscription is dropped.
class RecognitionSession : public AudioSink {
public:
    RecognitionSession(std::unique_ptr<SpeechDecoder> decoder, Channel<RecognitionResult>::Sender tx,
                       std::chrono::steady_clock::time_point started,
                       std::chrono::milliseconds timeout, const SpeechRecognizer::Clock& clock)
        : decoder_(std::move(decoder)),
          tx_(std::move(tx)),
          started_(started),
          timeout_(timeout),
          clock_(clock) {}

    void on_samples(const AudioChunk& chunk) override {
        if (done_) return;

        pcm_.clear();
        append_as_pcm16(chunk, pcm_);

        switch (decoder_->accept_waveform(pcm_.data(), pcm_.size())) {
        case DecodingState::Finalized:
            try {
                finish(RecognitionResult::final_text(decoder_->result()));
            } catch (const RecognitionError& e) {
                log_error(e.what());
                finish(RecognitionResult::failed());
            }
            break;
        case DecodingState::Failed:
            finish(RecognitionResult::failed());
            break;
        case DecodingState::Running:
            if (clock_() - started_ >= timeout_) {
                finish(RecognitionResult::cancelled());
            }
            break;
        }
    }

    void on_closed() override {
        done_ = true;
        tx_.close();
    }

private:
    void finish(RecognitionResult result) {
        done_ = true;
        tx_.send(std::move(result));
    }

    std::unique_ptr<SpeechDecoder> decoder_;
    Channel<RecognitionResult>::Sender tx_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::milliseconds timeout_;
    const SpeechRecognizer::Clock& clock_;
    std::vector<int16_t> pcm_;
    bool done_{false};
};

} // namespace

SpeechRecognizer::SpeechRecognizer(SpeechModel& model, AudioSource& source,
                                   std::chrono::milliseconds timeout, Clock clock)
    : model_(model), source_(source), timeout_(timeout), clock_(std::move(clock)) {}

RecognitionResult SpeechRecognizer::recognize() {
    std::unique_ptr<SpeechDecoder> decoder = model_.create_decoder(source_.format().sample_rate);

    auto channel = Channel<RecognitionResult>::make();
    RecognitionSession session(std::move(decoder), std::move(channel.first), clock_(), timeout_, clock_);

    Subscription subscription;
    try {
        subscription = source_.subscribe(&session);
    } catch (const AudioError& e) {
        throw RecognitionError(std::string("Failed to open capture session: ") + e.what());
    }

    std::optional<RecognitionResult> result = channel.second.recv();
    subscription.reset();

    if (!result) {
        throw RecognitionError("Capture stream closed during recognition");
    }
    log_info(std::string("Recognition ") + recognition_kind_name(result->kind) +
             (result->text.empty() ? "" : ": " + result->text));
    return *result;
}
