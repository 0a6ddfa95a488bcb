#pragma once

#include <filesystem>
#include <memory>
#include <span>
#include <string>

#include "synthesis_gateway.hpp"

namespace speakd {

// 16-bit PCM mono WAV.
void writeWav(const std::filesystem::path& path, std::span<const float> samples, int sampleRate);

// Synthesizes to a file instead of the speakers. Blocks until the file is on disk.
class SpeechExporter {
public:
    static constexpr const char* kDefaultOutputPath = "/tmp/kokoro_output.wav";

    SpeechExporter(std::shared_ptr<SynthesisGateway> synth, std::string ffmpeg = "ffmpeg");

    // Returns "Saved: <path>" or "No audio generated.". With mp3 the file is
    // written next to outputPath with an .mp3 extension.
    std::string save(const std::string& text,
                     const std::filesystem::path& outputPath,
                     const std::string& voice,
                     double speed,
                     bool mp3);

private:
    void encodeMp3(const std::filesystem::path& wav, const std::filesystem::path& mp3) const;

    std::shared_ptr<SynthesisGateway> synth_;
    std::string ffmpeg_;
};

} // namespace speakd
