#include "alsa_output.hpp"

#include <algorithm>
#include <vector>

#include <alsa/asoundlib.h>
#include <spdlog/spdlog.h>

using namespace std;

namespace speakd {

AlsaOutput::AlsaOutput(string device, float volume)
    : device_(std::move(device)), volume_(clamp(volume, 0.0f, 1.0f)) {}

AlsaOutput::~AlsaOutput() {
    close(false);
}

bool AlsaOutput::fail(const string& what, int err) {
    lastError_ = what + ": " + string(snd_strerror(err));
    if (handle_) {
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
    return false;
}

bool AlsaOutput::open(const AudioFormat& format) {
    if (handle_) {
        lastError_ = "Audio device already open";
        return false;
    }

    int err;
    if ((err = snd_pcm_open(&handle_, device_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        handle_ = nullptr;
        return fail("Cannot open audio device " + device_, err);
    }

    // Set hardware parameters
    snd_pcm_hw_params_t *params;
    snd_pcm_hw_params_alloca(&params);
    snd_pcm_hw_params_any(handle_, params);
    if ((err = snd_pcm_hw_params_set_access(handle_, params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        return fail("Cannot set access type", err);
    }
    if ((err = snd_pcm_hw_params_set_format(handle_, params, SND_PCM_FORMAT_FLOAT_LE)) < 0) {
        return fail("Cannot set sample format", err);
    }
    if ((err = snd_pcm_hw_params_set_channels(handle_, params, format.channels)) < 0) {
        return fail("Cannot set channel count", err);
    }

    unsigned int rate = format.sampleRate;
    if ((err = snd_pcm_hw_params_set_rate_near(handle_, params, &rate, 0)) < 0) {
        return fail("Cannot set sample rate", err);
    }
    if (rate != static_cast<unsigned int>(format.sampleRate)) {
        spdlog::warn("Audio device runs at {} Hz instead of {} Hz", rate, format.sampleRate);
    }

    // One write per period keeps pause/stop latency at a single block
    snd_pcm_uframes_t period = format.blockFrames;
    if ((err = snd_pcm_hw_params_set_period_size_near(handle_, params, &period, 0)) < 0) {
        return fail("Cannot set period size", err);
    }
    snd_pcm_uframes_t bufferSize = period * 4;
    if ((err = snd_pcm_hw_params_set_buffer_size_near(handle_, params, &bufferSize)) < 0) {
        return fail("Cannot set buffer size", err);
    }

    if ((err = snd_pcm_hw_params(handle_, params)) < 0) {
        return fail("Cannot set parameters", err);
    }
    if ((err = snd_pcm_prepare(handle_)) < 0) {
        return fail("Cannot prepare audio device", err);
    }

    spdlog::debug("Opened {} at {} Hz, period {} frames", device_, rate, period);
    lastError_.clear();
    return true;
}

bool AlsaOutput::write(span<const float> block) {
    if (!handle_) {
        lastError_ = "Audio device is not open";
        return false;
    }

    vector<float> scaled;
    const float* data = block.data();
    if (volume_ != 1.0f) {
        scaled.resize(block.size());
        transform(block.begin(), block.end(), scaled.begin(), [this](float s) { return s * volume_; });
        data = scaled.data();
    }

    size_t remaining = block.size();
    while (remaining > 0) {
        snd_pcm_sframes_t frames = snd_pcm_writei(handle_, data, remaining);
        if (frames < 0) {
            // Underrun after a pause is expected; anything unrecoverable is an error
            int err = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
            if (err < 0) {
                lastError_ = "Write error: " + string(snd_strerror(err));
                return false;
            }
            continue;
        }
        data += frames;
        remaining -= static_cast<size_t>(frames);
    }
    return true;
}

bool AlsaOutput::close(bool drain) {
    if (!handle_) return true;

    int err = drain ? snd_pcm_drain(handle_) : snd_pcm_drop(handle_);
    snd_pcm_close(handle_);
    handle_ = nullptr;
    if (err < 0) {
        lastError_ = string(drain ? "Drain" : "Drop") + " failed: " + snd_strerror(err);
        return false;
    }
    return true;
}

} // namespace speakd
