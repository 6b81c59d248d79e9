#include "speech_dispatcher.hpp"
#include "logging.hpp"

#include <libspeechd.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <mutex>

namespace {

// Message ids grow monotonically, so speech is ongoing while the last id
// handed out is newer than the last one that ended.
struct SpeechState {
    std::mutex mutex;
    int current_msg = 0;
    int last_done = 0;
};

std::atomic<SpeechState*> g_active{nullptr};

void on_finished(size_t msg_id, size_t, SPDNotificationType) {
    SpeechState* state = g_active.load();
    if (!state) return;

    std::lock_guard<std::mutex> lock(state->mutex);
    state->last_done = std::max(state->last_done, static_cast<int>(msg_id));
}

} // namespace

struct SpeechDispatcherSynthesizer::Impl {
    SPDConnection* conn = nullptr;
    SpeechState state;
};

SpeechDispatcherSynthesizer::SpeechDispatcherSynthesizer(int rate) : impl_(std::make_unique<Impl>()) {
    SpeechState* expected = nullptr;
    if (!g_active.compare_exchange_strong(expected, &impl_->state)) {
        throw SynthesizerError("A speech-dispatcher connection is already open");
    }

    char* error = nullptr;
    impl_->conn = spd_open2("hark", "main", nullptr, SPD_MODE_THREADED, nullptr, 1, &error);
    if (!impl_->conn) {
        std::string msg = "Failed to connect to speech-dispatcher";
        if (error) {
            msg += std::string(": ") + error;
            std::free(error);
        }
        g_active = nullptr;
        throw SynthesizerError(msg);
    }

    impl_->conn->callback_end = on_finished;
    impl_->conn->callback_cancel = on_finished;
    if (spd_set_notification_on(impl_->conn, SPD_END) != 0 ||
        spd_set_notification_on(impl_->conn, SPD_CANCEL) != 0) {
        spd_close(impl_->conn);
        g_active = nullptr;
        throw SynthesizerError("Failed to enable speech-dispatcher notifications");
    }

    if (spd_set_voice_rate(impl_->conn, rate) != 0) {
        log_warn("speech-dispatcher rejected voice rate " + std::to_string(rate));
    }
    log_info("Connected to speech-dispatcher");
}

SpeechDispatcherSynthesizer::~SpeechDispatcherSynthesizer() {
    if (impl_->conn) {
        spd_close(impl_->conn);
    }
    g_active = nullptr;
}

void SpeechDispatcherSynthesizer::speak(const std::string& text) {
    if (is_speaking() && spd_cancel(impl_->conn) != 0) {
        throw SynthesizerError("Failed to interrupt speech");
    }

    int id = spd_say(impl_->conn, SPD_TEXT, text.c_str());
    if (id < 0) {
        throw SynthesizerError("Failed to speak: " + text);
    }

    std::lock_guard<std::mutex> lock(impl_->state.mutex);
    impl_->state.current_msg = std::max(impl_->state.current_msg, id);
}

bool SpeechDispatcherSynthesizer::is_speaking() {
    std::lock_guard<std::mutex> lock(impl_->state.mutex);
    return impl_->state.current_msg > impl_->state.last_done;
}
