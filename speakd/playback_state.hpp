#pragma once

#include <string_view>

namespace speakd {

enum class PlaybackState { Idle, Playing, Paused };

std::string_view toString(PlaybackState state);

} // namespace speakd
