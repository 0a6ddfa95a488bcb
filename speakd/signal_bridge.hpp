#pragma once

#include <filesystem>

namespace speakd {

enum class Marker { Pause, Stop };

// Two presence/absence flags on the filesystem. Any process that can touch
// these paths can pause or stop playback without going through the daemon.
class SignalBridge {
public:
    static constexpr const char* kDefaultPausePath = "/tmp/kokoro-tts-pause";
    static constexpr const char* kDefaultStopPath = "/tmp/kokoro-tts-stop";

    SignalBridge();
    SignalBridge(std::filesystem::path pausePath, std::filesystem::path stopPath);

    void set(Marker marker) const;
    // Absence is not an error.
    void clear(Marker marker) const;
    bool exists(Marker marker) const;

    void clearAll() const;

    const std::filesystem::path& path(Marker marker) const;

private:
    std::filesystem::path pausePath_;
    std::filesystem::path stopPath_;
};

} // namespace speakd
