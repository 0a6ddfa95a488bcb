#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "piper/piper.hpp"
#include "synthesis_gateway.hpp"

namespace speakd {

// Piper voices laid out as <voicesDir>/<voice>/{encoder.onnx,decoder.onnx,config.json}.
// Each voice is loaded on first use and kept for the life of the gateway.
class PiperGateway : public SynthesisGateway {
public:
    struct InitOptions {
        std::filesystem::path voicesDir;
        std::optional<std::filesystem::path> eSpeakDataPath;
        std::string accelerator = ""; // e.g., "cuda", "tensorrt"
        int outputSampleRate = 24000;
    };

    explicit PiperGateway(InitOptions opts);
    ~PiperGateway() override;

    PiperGateway(const PiperGateway&) = delete;
    PiperGateway& operator=(const PiperGateway&) = delete;

    std::vector<float> synthesize(const std::string& text,
                                  const std::string& voice,
                                  double speed) override;

    int sampleRate() const override { return opts_.outputSampleRate; }

    bool hasVoice(const std::string& voice) const;
    size_t loadedVoiceCount();

    static std::vector<float> resample(std::span<const float> input, size_t orig_sr, size_t out_sr);

private:
    struct LoadedVoice {
        piper::Voice voice;
        float baseLengthScale = 1.0f;
    };

    // Caller holds mutex_
    LoadedVoice& loadVoice(const std::string& name);
    void configurePhonemizer(const piper::Voice& voice);

    InitOptions opts_;
    piper::PiperConfig cfg_;
    bool piperInitialized_ = false;
    bool eSpeakReady_ = false;

    // piper shares cfg_ and the eSpeak phonemizer across voices, so loading
    // and inference run one at a time for the whole gateway
    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<LoadedVoice>> voices_;
};

} // namespace speakd
