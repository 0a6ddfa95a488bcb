#include "stream_writer.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

using namespace std;

namespace speakd {

string_view toString(SessionOutcome outcome) {
    switch (outcome) {
    case SessionOutcome::Completed:
        return "completed";
    case SessionOutcome::Stopped:
        return "stopped";
    case SessionOutcome::DeviceFailed:
        break;
    }
    return "device-failed";
}

StreamWriter::StreamWriter(AudioOutputFactory factory, const SignalBridge& signals, Options opts)
    : factory_(std::move(factory)), signals_(signals), opts_(std::move(opts)) {}

bool StreamWriter::stopMarked(atomic<bool>& stopRequested) const {
    if (stopRequested.load() || signals_.exists(Marker::Stop)) {
        stopRequested.store(true);
        return true;
    }
    return false;
}

bool StreamWriter::waitWhilePaused(atomic<bool>& stopRequested, const StateCallback& onState) const {
    onState(PlaybackState::Paused);
    spdlog::debug("Playback paused");
    while (signals_.exists(Marker::Pause) && !stopRequested.load()) {
        if (signals_.exists(Marker::Stop)) {
            stopRequested.store(true);
            break;
        }
        this_thread::sleep_for(opts_.pollInterval);
    }
    if (stopRequested.load()) return false;

    // A stop that removed the pause marker must not let one more block through
    if (stopMarked(stopRequested)) return false;

    onState(PlaybackState::Playing);
    spdlog::debug("Playback resumed");
    return true;
}

SessionOutcome StreamWriter::run(span<const float> samples,
                                 atomic<bool>& stopRequested,
                                 const StateCallback& onState) {
    // Left over from a session that never got to clean up
    signals_.clear(Marker::Stop);

    SessionOutcome outcome = SessionOutcome::Completed;
    unique_ptr<AudioOutput> out;
    try {
        out = factory_();
        if (!out) throw runtime_error("No audio output available");
        if (!out->open(opts_.format)) {
            throw runtime_error("Cannot open audio output: " + out->lastError());
        }
        onState(PlaybackState::Playing);

        const size_t block = max<size_t>(1, opts_.format.blockFrames);
        size_t cursor = 0;
        while (cursor < samples.size()) {
            if (stopMarked(stopRequested)) {
                outcome = SessionOutcome::Stopped;
                break;
            }
            if (signals_.exists(Marker::Pause) && !waitWhilePaused(stopRequested, onState)) {
                outcome = SessionOutcome::Stopped;
                break;
            }

            const size_t n = min(block, samples.size() - cursor);
            if (!out->write(samples.subspan(cursor, n))) {
                throw runtime_error("Write error: " + out->lastError());
            }
            cursor += n;
        }

        if (!out->close(outcome == SessionOutcome::Completed)) {
            throw runtime_error("Cannot close audio output: " + out->lastError());
        }
        spdlog::debug("Session {} after {} of {} samples", toString(outcome), cursor, samples.size());
    } catch (const exception& e) {
        spdlog::error("Playback failed: {}", e.what());
        outcome = SessionOutcome::DeviceFailed;
        if (out && !out->close(false)) {
            spdlog::warn("Releasing audio output failed: {}", out->lastError());
        }
    }
    out.reset();

    onState(PlaybackState::Idle);
    signals_.clearAll();
    return outcome;
}

} // namespace speakd
