#include "assistant.hpp"
#include "audio_capture.hpp"
#include "embedding_model.hpp"
#include "logging.hpp"
#include "settings.hpp"

#include <ctime>
#include <iostream>
#include <memory>
#include <string>

namespace {

enum class Intent {
    Greeting,
    Weather,
    Time,
    Day,
    Date,
};

std::string now_formatted(const char* format) {
    std::time_t t = std::time(nullptr);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), format, &local);
    return std::string(buf, n);
}

std::string apology(CycleError::Kind kind) {
    switch (kind) {
    case CycleError::Kind::RecognitionInit:
        return "Failed to initialize speech recognition. Please try again.";
    case CycleError::Kind::RecognitionFailed:
        return "Failed to recognize speech. Please try again.";
    case CycleError::Kind::RecognitionTimeout:
        return "You took too long to speak, sorry. Please try again.";
    case CycleError::Kind::EmbeddingFailed:
        return "There was a problem with the intent recognizer. Please try again.";
    case CycleError::Kind::ScoreTooLow:
        return "I'm not sure I can do that, sorry.";
    case CycleError::Kind::SynthesizerUnavailable:
        break;
    }
    return {};
}

std::string respond(Intent intent) {
    switch (intent) {
    case Intent::Greeting:
        return "Hello! How can I help you today?";
    case Intent::Weather:
        return "I'm sorry, but I can't fetch the weather yet.";
    case Intent::Time:
        return "It's " + now_formatted("%I:%M:%S %p") + ".";
    case Intent::Day:
        return "It's " + now_formatted("%A") + ".";
    case Intent::Date:
        return "It's " + now_formatted("%B %d, %Y") + ".";
    }
    return {};
}

Assistant<Intent> start_assistant(const std::string& dir, const AssistantSettings& settings) {
    EmbeddingModelFilePaths files;
    files.onnx = config_file(dir, "intents/model.onnx");
    files.tokenizer = config_file(dir, "intents/tokenizer.json");
    files.config = config_file(dir, "intents/config.json");
    files.special_tokens_map = config_file(dir, "intents/special_tokens_map.json");
    files.tokenizer_config = config_file(dir, "intents/tokenizer_config.json");

    auto config = AssistantConfig<Intent>::build(config_file(dir, "vosk-model-small-en-us-0.15"),
                                                 files.to_local_embedding_model(), settings);

    config.add_wakeword_from_file("pizza", config_file(dir, "pizza.onnx"), true);
    config.add_intent(Intent::Greeting, {"hello", "hi", "hey"});
    config.add_intent(Intent::Weather, {"what's the weather like today", "what's the forecast"});
    config.add_intent(Intent::Time, {"what time is it", "what's the current time"});
    config.add_intent(Intent::Day, {"what day is it", "what's the current day"});
    config.add_intent(Intent::Date, {"what's the date", "what's today's date"});

    return config.start();
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        std::cout << "Listing input devices...\n";
        AudioCapture::list_devices();
        return 0;
    }

    std::string dir;
    AssistantSettings settings;
    try {
        dir = config_dir();
        settings = AssistantSettings::from_env();
        settings.wakeword_feature_dir = config_file(dir, "openwakeword");
    } catch (const ConfigError& e) {
        log_error(e.what());
        return 1;
    }

    std::unique_ptr<Assistant<Intent>> assistant;
    try {
        assistant = std::make_unique<Assistant<Intent>>(start_assistant(dir, settings));
    } catch (const std::exception& e) {
        log_error(std::string("Failed to start assistant: ") + e.what());
        std::cerr << "Please ensure the models are set up under " << dir << "\n";
        return 1;
    }

    std::cout << "Listening for wakewords... Press Ctrl+C to quit.\n";
    for (;;) {
        try {
            AssistantQuery<Intent> query = assistant->listen();
            if (!query.intent) {
                log_info("Wakeword '" + query.wakeword + "' without a command");
                continue;
            }
            assistant->speak(respond(*query.intent));
        } catch (const WakewordStreamClosed& e) {
            log_error(std::string(e.what()) + ", exiting");
            break;
        } catch (const CycleError& e) {
            log_error(e.what());
            std::string reply = apology(e.kind());
            if (reply.empty()) break;
            try {
                assistant->speak(reply);
            } catch (const SynthesizerError& se) {
                log_error(se.what());
                break;
            }
        } catch (const SynthesizerError& e) {
            log_error(std::string("Failed to speak: ") + e.what());
            break;
        }
    }

    std::cout << "Exiting.\n";
    return 1;
}
