#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace speakd {

struct AudioFormat {
    int sampleRate = 24000;
    int channels = 1;
    size_t blockFrames = 2048;
};

// One playback stream on an output device. Samples are mono float32.
// Implementations report failures through their return value and lastError().
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    virtual bool open(const AudioFormat& format) = 0;
    virtual bool write(std::span<const float> block) = 0;
    // drain=true plays out queued audio, false discards it. Safe to call twice.
    virtual bool close(bool drain) = 0;

    virtual std::string lastError() const = 0;
};

using AudioOutputFactory = std::function<std::unique_ptr<AudioOutput>()>;

} // namespace speakd
