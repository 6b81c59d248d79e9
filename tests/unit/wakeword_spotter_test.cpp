#include <cassert>
#include <cmath>
#include <memory>
#include <string>
#include <vector>
#include "fakes.hpp"
#include "wakeword_spotter.hpp"

int main() {
    // Sub-frame chunks adding up to one frame are scored exactly once.
    {
        FakeWakewordModel model(160);
        auto ch = Channel<std::string>::make();
        FrameDetector detector(model, AudioFormat(), std::move(ch.first));
        assert(detector.frame_samples() == 160);

        std::vector<int16_t> a(50, 0), b(50, 0), c(60, 0);
        for (auto* part : {&a, &b, &c}) {
            AudioChunk chunk;
            chunk.data = part->data();
            chunk.samples = part->size();
            detector.on_samples(chunk);
        }
        assert(model.frames_scored == 1);
        assert(detector.buffered_samples() == 0);

        std::vector<int16_t> more(10, 0);
        AudioChunk chunk;
        chunk.data = more.data();
        chunk.samples = more.size();
        detector.on_samples(chunk);
        assert(model.frames_scored == 1);
        assert(detector.buffered_samples() == 10);
    }

    // Stereo 48 kHz input is downmixed and resampled to the model frame.
    {
        FakeWakewordModel model(160);
        auto ch = Channel<std::string>::make();
        AudioFormat format{SampleFormat::I16, 2, 48000};
        FrameDetector detector(model, format, std::move(ch.first));
        assert(detector.frame_samples() == 960);

        std::vector<int16_t> samples(960);
        for (std::size_t i = 0; i < samples.size(); ++i) {
            samples[i] = (i % 2 == 0) ? 16384 : 0;
        }
        AudioChunk chunk;
        chunk.format = format;
        chunk.data = samples.data();
        chunk.samples = samples.size();
        detector.on_samples(chunk);
        assert(model.frames_scored == 1);
        assert(std::fabs(model.first_sample - 0.25f) < 1e-6f);
    }

    // A scoring error is logged and the stream keeps going.
    {
        FakeWakewordModel model(160);
        model.script({std::string("!error"), std::string("pizza")});
        auto ch = Channel<std::string>::make();
        FrameDetector detector(model, AudioFormat(), std::move(ch.first));
        std::vector<int16_t> two_frames(320, 0);
        AudioChunk chunk;
        chunk.data = two_frames.data();
        chunk.samples = two_frames.size();
        detector.on_samples(chunk);
        assert(model.frames_scored == 2);
        assert(*ch.second.recv() == "pizza");
    }

    // Any scoring failure stays on the capture thread.
    {
        FakeWakewordModel model(160);
        model.script({std::string("!fault"), std::string("pizza")});
        auto ch = Channel<std::string>::make();
        FrameDetector detector(model, AudioFormat(), std::move(ch.first));
        std::vector<int16_t> two_frames(320, 0);
        AudioChunk chunk;
        chunk.data = two_frames.data();
        chunk.samples = two_frames.size();
        detector.on_samples(chunk);
        assert(model.frames_scored == 2);
        assert(detector.buffered_samples() == 0);
        assert(*ch.second.recv() == "pizza");
    }

    // Starting without profiles fails; a bad profile file fails to load.
    {
        WakewordSpotter spotter(AudioFormat(), std::make_unique<FakeWakewordModel>());
        FakeAudioSource source;
        bool threw = false;
        try {
            spotter.start(source);
        } catch (const WakewordError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            spotter.add_profile("pizza", "missing.onnx");
        } catch (const WakewordError&) {
            threw = true;
        }
        assert(threw);
    }

    // Detections reach the listener; closing the stream ends listening.
    {
        auto model = std::make_unique<FakeWakewordModel>(160);
        FakeWakewordModel* raw = model.get();
        raw->script({std::nullopt, std::string("pizza")});

        WakewordSpotter spotter(AudioFormat(), std::move(model));
        spotter.add_profile("pizza", "pizza.onnx");
        assert(raw->profiles.size() == 1);

        FakeAudioSource source;
        WakewordListener listener = spotter.start(source);
        source.push(std::vector<int16_t>(320, 0));
        assert(*listener.listen() == "pizza");

        // Queued detections can be dropped without blocking.
        raw->push_detection("hey");
        raw->push_detection("pizza");
        source.push(std::vector<int16_t>(320, 0));
        assert(listener.discard_pending() == 2);
        assert(listener.discard_pending() == 0);

        source.close();
        assert(!listener.listen());

        bool threw = false;
        try {
            spotter.add_profile("hey", "hey.onnx");
        } catch (const WakewordError&) {
            threw = true;
        }
        assert(threw);
    }

    // build() negotiates a mono format at the model rate.
    {
        DeviceCapabilities caps;
        caps.name = "test";
        caps.default_format = AudioFormat{SampleFormat::I16, 2, 44100};
        caps.supported.push_back(SupportedFormatRange{SampleFormat::F32, 1, 8000, 48000});
        WakewordSpotter spotter = WakewordSpotter::build(caps, std::make_unique<FakeWakewordModel>());
        assert(spotter.format().channels == 1);
        assert(spotter.format().sample_rate == 16000);
        assert(spotter.format().format == SampleFormat::F32);
    }
    return 0;
}
