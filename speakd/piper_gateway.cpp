#include "piper_gateway.hpp"

#include <stdexcept>

#include <soxr.h>
#include <spdlog/spdlog.h>

#include "voice_catalog.hpp"

using namespace std;

namespace speakd {

namespace {
filesystem::path voiceDir(const filesystem::path& root, const string& base) {
    if (base.empty() || base.find('/') != string::npos || base == "..") {
        throw runtime_error("Invalid voice name: " + base);
    }
    return root / base;
}
} // namespace

PiperGateway::PiperGateway(InitOptions opts) : opts_(std::move(opts)) {
    if (!filesystem::is_directory(opts_.voicesDir)) {
        throw runtime_error("Voices directory doesn't exist: " + opts_.voicesDir.string());
    }
}

PiperGateway::~PiperGateway() {
    if (piperInitialized_) piper::terminate(cfg_);
}

bool PiperGateway::hasVoice(const string& voice) const {
    return filesystem::exists(voiceDir(opts_.voicesDir, baseVoiceName(voice)) / "config.json");
}

size_t PiperGateway::loadedVoiceCount() {
    lock_guard<mutex> lk(mutex_);
    return voices_.size();
}

void PiperGateway::configurePhonemizer(const piper::Voice& voice) {
    const bool needsESpeak = voice.phonemizeConfig.phonemeType == piper::eSpeakPhonemes;
    if (piperInitialized_ && (eSpeakReady_ || !needsESpeak)) return;

    // A voice without eSpeak phonemes may have been loaded first; bring eSpeak up now
    if (piperInitialized_) {
        piper::terminate(cfg_);
        piperInitialized_ = false;
    }

    if (needsESpeak) {
        cfg_.useESpeak = true;
        if (opts_.eSpeakDataPath) {
            cfg_.eSpeakDataPath = opts_.eSpeakDataPath->string();
        } else {
            auto exePath = filesystem::canonical("/proc/self/exe");
            cfg_.eSpeakDataPath = filesystem::absolute(exePath.parent_path().append("espeak-ng-data")).string();
        }
    } else {
        cfg_.useESpeak = false;
    }
    piper::initialize(cfg_);
    piperInitialized_ = true;
    eSpeakReady_ = needsESpeak;
}

PiperGateway::LoadedVoice& PiperGateway::loadVoice(const string& name) {
    const auto base = baseVoiceName(name);
    auto it = voices_.find(base);
    if (it != voices_.end()) return *it->second;

    const auto dir = voiceDir(opts_.voicesDir, base);
    const auto encoder = dir / "encoder.onnx";
    const auto decoder = dir / "decoder.onnx";
    const auto config = dir / "config.json";
    for (const auto& p : {encoder, decoder, config}) {
        if (!filesystem::exists(p)) throw runtime_error("Voice file doesn't exist: " + p.string());
    }

    spdlog::info("Loading voice {} from {}", base, dir.string());
    auto loaded = make_unique<LoadedVoice>();
    std::optional<piper::SpeakerId> speakerId = std::nullopt;
    piper::loadVoice(cfg_, "", encoder.string(), decoder.string(), config.string(),
                     loaded->voice, speakerId, opts_.accelerator);
    loaded->baseLengthScale = loaded->voice.synthesisConfig.lengthScale;
    configurePhonemizer(loaded->voice);

    auto& ref = *loaded;
    voices_.emplace(base, std::move(loaded));
    return ref;
}

vector<float> PiperGateway::synthesize(const string& text, const string& voice, double speed) {
    vector<int16_t> pcm;
    int nativeRate = 0;
    {
        lock_guard<mutex> lk(mutex_);
        auto& v = loadVoice(voice);
        v.voice.synthesisConfig.lengthScale = static_cast<float>(v.baseLengthScale / speed);
        nativeRate = v.voice.synthesisConfig.sampleRate;

        vector<int16_t> chunk;
        piper::SynthesisResult result;
        auto cb = [&]() {
            pcm.insert(pcm.end(), chunk.begin(), chunk.end());
            chunk.clear();
        };
        piper::textToAudio(cfg_, v.voice, text, chunk, result, cb);
        // Anything left after the last callback
        pcm.insert(pcm.end(), chunk.begin(), chunk.end());
        spdlog::debug("Synthesized {} samples in {:.2f}s (rtf {:.2f})", pcm.size(),
                      result.inferSeconds, result.realTimeFactor);
    }

    vector<float> audio(pcm.size());
    for (size_t i = 0; i < pcm.size(); i++) audio[i] = pcm[i] / 32768.0f;

    if (audio.empty() || nativeRate == opts_.outputSampleRate) return audio;
    return resample(audio, nativeRate, opts_.outputSampleRate);
}

vector<float> PiperGateway::resample(span<const float> input, size_t orig_sr, size_t out_sr) {
    soxr_io_spec_t io_spec = soxr_io_spec(SOXR_FLOAT32_I, SOXR_FLOAT32_I);
    soxr_quality_spec_t q_spec = soxr_quality_spec(SOXR_MQ, 0);
    vector<float> output(input.size() * out_sr / orig_sr + 16);
    size_t odone = 0;
    soxr_error_t error = soxr_oneshot(orig_sr, out_sr, 1, input.data(), input.size(), nullptr,
                                      output.data(), output.size(), &odone,
                                      &io_spec, &q_spec, nullptr);
    if (error != NULL) throw runtime_error(string("soxr resampling failed: ") + error);
    output.resize(odone);
    return output;
}

} // namespace speakd
