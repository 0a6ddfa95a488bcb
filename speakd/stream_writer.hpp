#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <span>
#include <string_view>

#include "audio_output.hpp"
#include "playback_state.hpp"
#include "signal_bridge.hpp"

namespace speakd {

enum class SessionOutcome { Completed, Stopped, DeviceFailed };

std::string_view toString(SessionOutcome outcome);

// Drains one sample buffer to an output device block by block. Pause and stop
// are honored at block boundaries only, so the worst-case latency is one
// block of audio plus one poll interval.
class StreamWriter {
public:
    using StateCallback = std::function<void(PlaybackState)>;

    struct Options {
        AudioFormat format;
        std::chrono::milliseconds pollInterval{100};
    };

    StreamWriter(AudioOutputFactory factory, const SignalBridge& signals, Options opts);

    // Runs on the worker thread. Never throws for device problems; the
    // returned outcome says how the session ended. onState is always left
    // at Idle when this returns.
    SessionOutcome run(std::span<const float> samples,
                       std::atomic<bool>& stopRequested,
                       const StateCallback& onState);

    const Options& options() const { return opts_; }

private:
    bool stopMarked(std::atomic<bool>& stopRequested) const;
    // Returns false when a stop arrived while paused.
    bool waitWhilePaused(std::atomic<bool>& stopRequested, const StateCallback& onState) const;

    AudioOutputFactory factory_;
    const SignalBridge& signals_;
    Options opts_;
};

} // namespace speakd
