#include "playback_state.hpp"

namespace speakd {

std::string_view toString(PlaybackState state) {
    switch (state) {
    case PlaybackState::Playing:
        return "playing";
    case PlaybackState::Paused:
        return "paused";
    case PlaybackState::Idle:
        break;
    }
    return "idle";
}

} // namespace speakd
