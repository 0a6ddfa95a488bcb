#pragma once

#include <string>

#include "audio_output.hpp"

typedef struct _snd_pcm snd_pcm_t;

namespace speakd {

class AlsaOutput : public AudioOutput {
public:
    explicit AlsaOutput(std::string device = "default", float volume = 1.0f);
    ~AlsaOutput() override;

    bool open(const AudioFormat& format) override;
    bool write(std::span<const float> block) override;
    bool close(bool drain) override;

    std::string lastError() const override { return lastError_; }

private:
    bool fail(const std::string& what, int err);

    std::string device_;
    float volume_;
    snd_pcm_t* handle_ = nullptr;
    std::string lastError_;
};

} // namespace speakd
