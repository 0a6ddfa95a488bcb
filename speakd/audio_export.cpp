#include "audio_export.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "speech_text.hpp"

extern char** environ;

using namespace std;

namespace speakd {

namespace {

void putLE(ostream& os, uint32_t v, int bytes) {
    for (int i = 0; i < bytes; i++) {
        os.put(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

int16_t toPcm16(float s) {
    if (!isfinite(s)) return 0;
    const float scaled = clamp(s, -1.0f, 1.0f) * 32767.0f;
    return static_cast<int16_t>(lrintf(scaled));
}

} // namespace

void writeWav(const filesystem::path& path, span<const float> samples, int sampleRate) {
    ofstream out(path, ios::binary | ios::trunc);
    if (!out.is_open()) throw runtime_error("Cannot open file: " + path.string());

    const uint16_t channels = 1;
    const uint16_t bitsPerSample = 16;
    const uint32_t blockAlign = channels * bitsPerSample / 8;
    const uint32_t dataBytes = static_cast<uint32_t>(samples.size() * blockAlign);

    out.write("RIFF", 4);
    putLE(out, 36 + dataBytes, 4);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    putLE(out, 16, 4);
    putLE(out, 1, 2); // PCM
    putLE(out, channels, 2);
    putLE(out, static_cast<uint32_t>(sampleRate), 4);
    putLE(out, static_cast<uint32_t>(sampleRate) * blockAlign, 4);
    putLE(out, blockAlign, 2);
    putLE(out, bitsPerSample, 2);
    out.write("data", 4);
    putLE(out, dataBytes, 4);

    vector<int16_t> pcm(samples.size());
    transform(samples.begin(), samples.end(), pcm.begin(), toPcm16);
    for (int16_t s : pcm) putLE(out, static_cast<uint16_t>(s), 2);

    out.flush();
    if (!out.good()) throw runtime_error("Failed writing " + path.string());
}

SpeechExporter::SpeechExporter(shared_ptr<SynthesisGateway> synth, string ffmpeg)
    : synth_(std::move(synth)), ffmpeg_(std::move(ffmpeg)) {
    if (!synth_) throw invalid_argument("SpeechExporter needs a synthesis gateway");
}

string SpeechExporter::save(const string& text,
                            const filesystem::path& outputPath,
                            const string& voice,
                            double speed,
                            bool mp3) {
    if (!(speed > 0.0) || !isfinite(speed)) {
        throw invalid_argument("speed must be a positive number");
    }

    auto audio = synth_->synthesize(padShortText(text), voice, speed);
    if (audio.empty()) return "No audio generated.";

    if (outputPath.has_parent_path()) {
        filesystem::create_directories(outputPath.parent_path());
    }

    auto wavPath = outputPath;
    if (mp3) wavPath.replace_extension(".wav");
    writeWav(wavPath, audio, synth_->sampleRate());
    spdlog::info("Wrote {} samples to {}", audio.size(), wavPath.string());

    if (!mp3) return "Saved: " + wavPath.string();

    auto mp3Path = outputPath;
    mp3Path.replace_extension(".mp3");
    error_code ec;
    try {
        encodeMp3(wavPath, mp3Path);
    } catch (const exception&) {
        filesystem::remove(wavPath, ec);
        throw;
    }
    filesystem::remove(wavPath, ec);
    if (ec) spdlog::warn("Cannot remove {}: {}", wavPath.string(), ec.message());
    return "Saved: " + mp3Path.string();
}

void SpeechExporter::encodeMp3(const filesystem::path& wav, const filesystem::path& mp3) const {
    vector<string> args = {ffmpeg_, "-y", "-i", wav.string(), "-codec:a", "libmp3lame",
                           "-b:a", "128k", "-ac", "1", mp3.string()};
    vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    // ffmpeg chatter must not reach stdout, which carries the protocol
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = 0;
    int err = posix_spawnp(&pid, ffmpeg_.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (err != 0) {
        throw runtime_error(fmt::format("Cannot run {}: {}", ffmpeg_, strerror(err)));
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        throw runtime_error("waitpid failed for " + ffmpeg_);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw runtime_error(fmt::format("{} failed converting {} to mp3", ffmpeg_, wav.string()));
    }
}

} // namespace speakd
