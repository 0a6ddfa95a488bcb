#include "playback_controller.hpp"

#include <atomic>
#include <cmath>
#include <cstdint>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "speech_text.hpp"

using namespace std;

namespace speakd {

struct PlaybackController::Session {
    uint64_t id = 0;
    atomic<bool> stopRequested{false};
    thread worker;
    future<void> finished;
};

// Shared with worker threads, which may outlive a stop() that timed out.
struct PlaybackController::Context {
    mutable mutex mtx;
    PlaybackState state = PlaybackState::Idle;
    uint64_t generation = 0;

    AudioOutputFactory outputs;
    shared_ptr<const SignalBridge> signals;
    StreamWriter::Options writerOptions;

    // Updates from a retired session are dropped.
    void setState(uint64_t session, PlaybackState s) {
        lock_guard<mutex> lk(mtx);
        if (session == generation) state = s;
    }
};

PlaybackController::PlaybackController(shared_ptr<SynthesisGateway> synth,
                                       AudioOutputFactory outputs,
                                       shared_ptr<const SignalBridge> signals,
                                       Options opts)
    : synth_(std::move(synth)), signals_(std::move(signals)), opts_(std::move(opts)),
      ctx_(make_shared<Context>()) {
    if (!synth_) throw invalid_argument("PlaybackController needs a synthesis gateway");
    if (!signals_) throw invalid_argument("PlaybackController needs a signal bridge");
    if (!outputs) throw invalid_argument("PlaybackController needs an audio output factory");
    ctx_->outputs = std::move(outputs);
    ctx_->signals = signals_;
    ctx_->writerOptions = opts_.writer;
}

PlaybackController::~PlaybackController() {
    lock_guard<mutex> lk(transitionMutex_);
    if (session_) retireSession(true);
}

PlaybackState PlaybackController::status() const {
    lock_guard<mutex> lk(ctx_->mtx);
    return ctx_->state;
}

string PlaybackController::speak(const string& text, const string& voice, double speed) {
    if (!(speed > 0.0) || !isfinite(speed)) {
        throw invalid_argument("speed must be a positive number");
    }

    lock_guard<mutex> lk(transitionMutex_);
    if (status() != PlaybackState::Idle) {
        spdlog::info("Preempting current playback");
        retireSession(true);
    } else {
        retireSession(false);
    }

    const string padded = padShortText(text);
    const size_t words = wordCount(padded);

    auto samples = synth_->synthesize(padded, voice, speed);
    if (samples.empty()) {
        spdlog::info("Synthesis produced no audio for voice {}", voice);
        return "No audio generated.";
    }
    if (synth_->sampleRate() != opts_.writer.format.sampleRate) {
        throw runtime_error(fmt::format("Synthesizer produces {} Hz audio, output expects {} Hz",
                                        synth_->sampleRate(), opts_.writer.format.sampleRate));
    }

    spdlog::debug("Starting playback of {} samples", samples.size());
    startSession(std::move(samples));
    return fmt::format("Speaking {} words with voice {} at {}x speed.", words, voice, formatSpeed(speed));
}

void PlaybackController::startSession(vector<float> samples) {
    auto session = make_shared<Session>();
    promise<void> done;
    session->finished = done.get_future();
    {
        lock_guard<mutex> lk(ctx_->mtx);
        session->id = ++ctx_->generation;
        // Playing from the moment speak() returns, not only once the device is open
        ctx_->state = PlaybackState::Playing;
    }

    session->worker = thread([ctx = ctx_, session, samples = std::move(samples), done = std::move(done)]() mutable {
        try {
            StreamWriter writer(ctx->outputs, *ctx->signals, ctx->writerOptions);
            auto outcome = writer.run(samples, session->stopRequested,
                                      [&](PlaybackState s) { ctx->setState(session->id, s); });
            spdlog::info("Playback {}", toString(outcome));
        } catch (const exception& e) {
            spdlog::error("Playback worker failed: {}", e.what());
            ctx->setState(session->id, PlaybackState::Idle);
        }
        done.set_value();
    });
    session_ = std::move(session);
}

void PlaybackController::retireSession(bool requestStop) {
    auto session = std::move(session_);
    if (requestStop && session) session->stopRequested.store(true);
    // A worker parked in the pause loop must see the pause go away, and a
    // pause that raced the end of the last session must not hold the next one
    if (requestStop || session) signals_->clearAll();

    if (session && session->worker.joinable()) {
        if (session->finished.wait_for(opts_.stopTimeout) == future_status::ready) {
            session->worker.join();
        } else {
            spdlog::warn("Playback worker did not exit within {} ms; detaching it", opts_.stopTimeout.count());
            session->worker.detach();
        }
    }

    lock_guard<mutex> lk(ctx_->mtx);
    ctx_->generation++;
    ctx_->state = PlaybackState::Idle;
}

string PlaybackController::pause() {
    switch (status()) {
    case PlaybackState::Idle:
        return "No audio is currently playing.";
    case PlaybackState::Paused:
        return "Already paused.";
    case PlaybackState::Playing:
        break;
    }
    signals_->set(Marker::Pause);
    return "Paused.";
}

string PlaybackController::resume() {
    if (status() != PlaybackState::Paused) {
        return "Audio is not paused.";
    }
    signals_->clear(Marker::Pause);
    return "Resumed.";
}

string PlaybackController::stop() {
    lock_guard<mutex> lk(transitionMutex_);
    if (status() == PlaybackState::Idle) {
        return "No audio is currently playing.";
    }
    retireSession(true);
    spdlog::info("Playback stopped");
    return "Stopped audio playback.";
}

} // namespace speakd
