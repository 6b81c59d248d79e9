#include <cassert>
#include <chrono>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "assistant.hpp"
#include "fakes.hpp"

namespace {

enum class Intent { Greeting, Time };

// Raw handles on the fakes owned by one assistant.
struct Rig {
    FakeAudioSource* source = nullptr;
    FakeWakewordModel* wakeword = nullptr;
    FakeSpeechModel* speech = nullptr;
    FakeSynthesizer* synth = nullptr;
    int embedder_builds = 0;
};

AssistantConfig<Intent> make_config(Rig& rig, AssistantSettings settings = AssistantSettings()) {
    auto source = std::make_unique<FakeAudioSource>();
    auto wakeword = std::make_unique<FakeWakewordModel>(160);
    auto speech = std::make_unique<FakeSpeechModel>();
    auto synth = std::make_unique<FakeSynthesizer>();
    rig.source = source.get();
    rig.wakeword = wakeword.get();
    rig.speech = speech.get();
    rig.synth = synth.get();

    std::map<std::string, std::vector<float>> table{
        {"hello", {1.0f, 0.0f, 0.0f}},
        {"what time is it", {0.0f, 1.0f, 0.0f}},
        {"tell me the time", {0.1f, 0.9f, 0.0f}},
        {"sing a song", {0.0f, 0.0f, 1.0f}},
    };
    int* builds = &rig.embedder_builds;
    auto factory = [table, builds] {
        ++*builds;
        return std::make_unique<FakeEmbedder>(table);
    };

    settings.speaking_poll_interval = std::chrono::milliseconds(1);
    AssistantConfig<Intent> config(std::move(source), WakewordSpotter(AudioFormat(), std::move(wakeword)),
                                   std::move(speech), std::move(synth), factory, settings);
    return config;
}

Assistant<Intent> start(Rig& rig, std::deque<std::optional<std::string>> detections,
                        AssistantSettings settings = AssistantSettings()) {
    auto config = make_config(rig, settings);
    config.add_wakeword_from_file("pizza", "pizza.onnx", true);
    config.add_wakeword_from_file("hey", "hey.onnx", false);
    config.add_intent(Intent::Greeting, {"hello"});
    config.add_intent(Intent::Time, {"what time is it"});
    rig.wakeword->script(std::move(detections));
    return config.start();
}

CycleError::Kind failed_cycle(Assistant<Intent>& assistant, std::string* wakeword = nullptr) {
    try {
        assistant.listen();
    } catch (const CycleError& e) {
        if (wakeword) *wakeword = e.wakeword();
        return e.kind();
    }
    assert(false && "cycle succeeded");
    return CycleError::Kind::RecognitionInit;
}

// Runs one listen() while the stream is live, then kills the stream. True
// when nothing reached the caller before the stream closed.
bool ends_with_closed_stream(Assistant<Intent>& assistant, Rig& rig) {
    auto pending = std::async(std::launch::async, [&assistant] { assistant.listen(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    rig.source->close();
    try {
        pending.get();
    } catch (const WakewordStreamClosed&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    // Listening wakeword runs recognition and classification.
    {
        Rig rig;
        auto assistant = start(rig, {std::string("pizza")});
        rig.speech->script = DecoderScript{2, DecodingState::Finalized, "tell me the time"};
        assert(rig.source->started);
        assert(rig.embedder_builds == 1);

        AssistantQuery<Intent> query = assistant.listen();
        assert(query.wakeword == "pizza");
        assert(query.intent && *query.intent == Intent::Time);
        assert(rig.speech->decoders_created == 1);
    }

    // A bare wakeword is reported without recognition.
    {
        Rig rig;
        auto assistant = start(rig, {std::string("hey")});
        AssistantQuery<Intent> query = assistant.listen();
        assert(query.wakeword == "hey");
        assert(!query.intent);
        assert(rig.speech->decoders_created == 0);
    }

    // A wakeword heard while speaking is dropped after speech ends.
    {
        Rig rig;
        auto assistant = start(rig, {std::string("pizza")});
        rig.synth->speaking_polls = 3;
        assert(ends_with_closed_stream(assistant, rig));
        assert(rig.speech->decoders_created == 0);
        assert(rig.synth->speaking_polls == 0);
        assert(rig.synth->polls == 4);
    }

    // Every wakeword queued during speech is dropped, not just the first.
    {
        Rig rig;
        auto assistant = start(rig, {std::string("pizza"), std::string("pizza"), std::string("hey")});
        rig.synth->speaking_until = std::chrono::steady_clock::now() + std::chrono::milliseconds(150);
        rig.speech->script = DecoderScript{1, DecodingState::Finalized, "hello"};
        assert(ends_with_closed_stream(assistant, rig));
        assert(rig.speech->decoders_created == 0);
    }

    // Wakewords heard during recognition do not start another cycle.
    {
        Rig rig;
        auto assistant = start(rig, {std::string("pizza"), std::nullopt, std::string("pizza")});
        rig.speech->script = DecoderScript{20, DecodingState::Finalized, "hello"};
        AssistantQuery<Intent> query = assistant.listen();
        assert(query.intent && *query.intent == Intent::Greeting);
        assert(ends_with_closed_stream(assistant, rig));
        assert(rig.speech->decoders_created == 1);
    }

    // Per-cycle failures carry the wakeword and leave the assistant usable.
    {
        Rig rig;
        auto assistant = start(rig, {std::string("pizza")});
        rig.speech->script = DecoderScript{1, DecodingState::Failed, ""};
        std::string wakeword;
        assert(failed_cycle(assistant, &wakeword) == CycleError::Kind::RecognitionFailed);
        assert(wakeword == "pizza");

        rig.wakeword->push_detection("pizza");
        rig.speech->script = DecoderScript{1, DecodingState::Finalized, "hello"};
        AssistantQuery<Intent> query = assistant.listen();
        assert(query.intent && *query.intent == Intent::Greeting);
    }
    {
        Rig rig;
        AssistantSettings settings;
        settings.recognition_timeout = std::chrono::milliseconds(0);
        auto assistant = start(rig, {std::string("pizza")}, settings);
        rig.speech->script = DecoderScript{-1, DecodingState::Running, ""};
        assert(failed_cycle(assistant) == CycleError::Kind::RecognitionTimeout);
    }
    {
        Rig rig;
        auto assistant = start(rig, {std::string("pizza")});
        rig.speech->fail_create = true;
        assert(failed_cycle(assistant) == CycleError::Kind::RecognitionInit);
    }
    {
        Rig rig;
        auto assistant = start(rig, {std::string("pizza")});
        rig.speech->script = DecoderScript{1, DecodingState::Finalized, "sing a song"};
        assert(failed_cycle(assistant) == CycleError::Kind::ScoreTooLow);
    }
    {
        Rig rig;
        auto assistant = start(rig, {std::string("pizza")});
        rig.speech->script = DecoderScript{1, DecodingState::Finalized, "mumble"};
        assert(failed_cycle(assistant) == CycleError::Kind::EmbeddingFailed);
    }
    {
        Rig rig;
        auto assistant = start(rig, {std::string("hey")});
        rig.synth->broken = true;
        std::string wakeword;
        assert(failed_cycle(assistant, &wakeword) == CycleError::Kind::SynthesizerUnavailable);
        assert(wakeword == "hey");

        bool threw = false;
        try {
            assistant.speak("hello");
        } catch (const SynthesizerError&) {
            threw = true;
        }
        assert(threw);
    }

    // A dead capture stream is fatal.
    {
        Rig rig;
        auto assistant = start(rig, {});
        rig.source->close();
        bool threw = false;
        try {
            assistant.listen();
        } catch (const WakewordStreamClosed&) {
            threw = true;
        }
        assert(threw);
    }

    // Speaking goes to the synthesizer; finish_speaking waits it out.
    {
        Rig rig;
        auto assistant = start(rig, {});
        assistant.speak("Hello! How can I help you today?");
        assert(rig.synth->spoken.size() == 1);
        rig.synth->speaking_polls = 2;
        assistant.finish_speaking();
        assert(rig.synth->polls == 3);
    }

    // start() validates intents before building the model or opening audio.
    {
        Rig rig;
        auto config = make_config(rig);
        config.add_wakeword_from_file("pizza", "pizza.onnx", true);
        bool threw = false;
        try {
            config.start();
        } catch (const IntentError& e) {
            threw = e.kind() == IntentError::Kind::NoIntentsProvided;
        }
        assert(threw);
        assert(rig.embedder_builds == 0);
        assert(!rig.source->started);
    }
    {
        Rig rig;
        auto config = make_config(rig);
        config.add_intent(Intent::Greeting, {"hello"});
        bool threw = false;
        try {
            config.start();
        } catch (const WakewordError&) {
            threw = true;
        }
        assert(threw);
    }
    return 0;
}
