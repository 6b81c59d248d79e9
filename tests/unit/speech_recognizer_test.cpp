#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include "fakes.hpp"
#include "speech_recognizer.hpp"

int main() {
    // The decoder finalizing produces the transcript.
    {
        FakeAudioSource source;
        FakeSpeechModel model;
        model.script = DecoderScript{3, DecodingState::Finalized, "what time is it"};
        source.start(AudioFormat());

        SpeechRecognizer recognizer(model, source);
        RecognitionResult result = recognizer.recognize();
        assert(result.kind == RecognitionResult::Kind::Final);
        assert(result.text == "what time is it");
        assert(model.chunks_accepted == 3);
        assert(model.last_rate == 16000);
    }

    // Decoder failure.
    {
        FakeAudioSource source;
        FakeSpeechModel model;
        model.script = DecoderScript{1, DecodingState::Failed, ""};
        source.start(AudioFormat());

        SpeechRecognizer recognizer(model, source);
        assert(recognizer.recognize().kind == RecognitionResult::Kind::Failed);
    }

    // An unreadable result counts as a failed decode.
    {
        FakeAudioSource source;
        FakeSpeechModel model;
        model.script = DecoderScript{1, DecodingState::Finalized, "", true};
        source.start(AudioFormat());

        SpeechRecognizer recognizer(model, source);
        assert(recognizer.recognize().kind == RecognitionResult::Kind::Failed);
    }

    // Every clock reading advances one second. A decoder that never ends is
    // cancelled on the chunk that reaches 20 s, and not before.
    {
        FakeAudioSource source;
        FakeSpeechModel model;
        model.script = DecoderScript{-1, DecodingState::Running, ""};

        const auto base = std::chrono::steady_clock::time_point();
        std::atomic<int> ticks{0};
        SpeechRecognizer recognizer(model, source, SpeechRecognizer::kDefaultTimeout,
                                    [&] { return base + std::chrono::seconds(ticks++); });
        source.start(AudioFormat());

        RecognitionResult result = recognizer.recognize();
        assert(result.kind == RecognitionResult::Kind::Cancelled);
        assert(model.chunks_accepted == 20);
        assert(ticks == 21);
    }

    // Each call is a new session at the stream's rate.
    {
        FakeAudioSource source(AudioFormat{SampleFormat::I16, 1, 44100});
        FakeSpeechModel model;
        model.script = DecoderScript{1, DecodingState::Finalized, "hi"};
        source.start(AudioFormat{SampleFormat::I16, 1, 44100});

        SpeechRecognizer recognizer(model, source);
        assert(recognizer.recognize().text == "hi");
        assert(recognizer.recognize().text == "hi");
        assert(model.decoders_created == 2);
        assert(model.last_rate == 44100);
    }

    // No decoder.
    {
        FakeAudioSource source;
        FakeSpeechModel model;
        model.fail_create = true;
        SpeechRecognizer recognizer(model, source);
        bool threw = false;
        try {
            recognizer.recognize();
        } catch (const RecognitionError&) {
            threw = true;
        }
        assert(threw);
    }

    // The stream dying mid-session is an error, and so is starting on a
    // stream that is already gone.
    {
        FakeAudioSource source;
        FakeSpeechModel model;
        model.script = DecoderScript{-1, DecodingState::Running, ""};
        SpeechRecognizer recognizer(model, source);

        std::thread closer([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            source.close();
        });
        bool threw = false;
        try {
            recognizer.recognize();
        } catch (const RecognitionError&) {
            threw = true;
        }
        closer.join();
        assert(threw);

        threw = false;
        try {
            recognizer.recognize();
        } catch (const RecognitionError&) {
            threw = true;
        }
        assert(threw);
    }
    return 0;
}
