#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "audio_output.hpp"
#include "playback_state.hpp"
#include "signal_bridge.hpp"
#include "stream_writer.hpp"
#include "synthesis_gateway.hpp"

namespace speakd {

// Owns the single playback session. speak() and stop() are serialized with
// each other; pause(), resume() and status() never wait for them.
class PlaybackController {
public:
    struct Options {
        StreamWriter::Options writer;
        std::chrono::milliseconds stopTimeout{3000};
    };

    PlaybackController(std::shared_ptr<SynthesisGateway> synth,
                       AudioOutputFactory outputs,
                       std::shared_ptr<const SignalBridge> signals,
                       Options opts);
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    // Preempts any current session, synthesizes on the calling thread and
    // starts playback in the background. Throws std::invalid_argument for a
    // non-positive speed; synthesis errors propagate unchanged.
    std::string speak(const std::string& text, const std::string& voice, double speed);

    // The worker observes the marker and moves to Paused itself, so the
    // state may still read Playing right after this returns.
    std::string pause();
    std::string resume();
    std::string stop();

    PlaybackState status() const;

    const SignalBridge& signals() const { return *signals_; }
    const Options& options() const { return opts_; }

private:
    struct Session;
    struct Context;

    void startSession(std::vector<float> samples);
    // Caller holds transitionMutex_.
    void retireSession(bool requestStop);

    std::shared_ptr<SynthesisGateway> synth_;
    std::shared_ptr<const SignalBridge> signals_;
    Options opts_;
    std::shared_ptr<Context> ctx_;

    std::mutex transitionMutex_;
    std::shared_ptr<Session> session_;
};

} // namespace speakd
