
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "alsa_output.hpp"
#include "audio_export.hpp"
#include "piper_gateway.hpp"
#include "playback_controller.hpp"
#include "signal_bridge.hpp"
#include "tool_server.hpp"

using json = nlohmann::json;
using namespace std;
using namespace speakd;

struct RunConfig {
    filesystem::path voicesDir;
    optional<filesystem::path> eSpeakDataPath;
    string accelerator = "";
    string device = "default";
    float volume = 1.0f;
    filesystem::path pauseMarker = SignalBridge::kDefaultPausePath;
    filesystem::path stopMarker = SignalBridge::kDefaultStopPath;
    int pollMs = 100;
    int stopTimeoutMs = 3000;
    string ffmpeg = "ffmpeg";
    int maxConcurrency = 4;
};

static atomic<bool> gShuttingDown{false};

static void printError(const string &msg) {
    json e;
    e["error"] = msg;
    cerr << e.dump() << '\n';
    cerr.flush();
}

static void printUsage(const char *argv0) {
    cerr << "\nusage: " << argv0 << " [options]\n\n";
    cerr << "options:\n";
    cerr << "   --voices-dir DIR          directory with one subdirectory per voice\n";
    cerr << "   --espeak_data DIR         path to espeak-ng data directory\n";
    cerr << "   --accelerator STR         accelerator for ONNX (e.g., cuda|tensorrt)\n";
    cerr << "   --device NAME             ALSA playback device (default: default)\n";
    cerr << "   --volume FLOAT            volume level for audio playback (0.0 to 1.0)\n";
    cerr << "   --pause-marker FILE       pause marker path (default " << SignalBridge::kDefaultPausePath << ")\n";
    cerr << "   --stop-marker FILE        stop marker path (default " << SignalBridge::kDefaultStopPath << ")\n";
    cerr << "   --poll-ms N               marker poll interval while paused (default 100)\n";
    cerr << "   --stop-timeout-ms N       how long stop waits for playback to end (default 3000)\n";
    cerr << "   --ffmpeg PATH             ffmpeg binary used for mp3 export\n";
    cerr << "   --max-concurrency N       number of concurrent requests (default 4)\n";
    cerr << "   --debug                   verbose logging\n";
    cerr << "   -q, --quiet               no logging\n";
}

static void parseArgs(int argc, char *argv[], RunConfig &cfg) {
    for (int i = 1; i < argc; i++) {
        string arg = argv[i];

        if (arg == "--voices-dir" && i + 1 < argc) {
            cfg.voicesDir = filesystem::path(argv[++i]);
        } else if ((arg == "--espeak_data" || arg == "--espeak-data") && i + 1 < argc) {
            cfg.eSpeakDataPath = filesystem::path(argv[++i]);
        } else if (arg == "--accelerator" && i + 1 < argc) {
            cfg.accelerator = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            cfg.device = argv[++i];
        } else if (arg == "--volume" && i + 1 < argc) {
            cfg.volume = stof(argv[++i]);
            if (cfg.volume < 0.0f || cfg.volume > 1.0f) {
                throw runtime_error("Volume must be between 0.0 and 1.0");
            }
        } else if (arg == "--pause-marker" && i + 1 < argc) {
            cfg.pauseMarker = filesystem::path(argv[++i]);
        } else if (arg == "--stop-marker" && i + 1 < argc) {
            cfg.stopMarker = filesystem::path(argv[++i]);
        } else if (arg == "--poll-ms" && i + 1 < argc) {
            cfg.pollMs = stoi(argv[++i]);
            if (cfg.pollMs < 1) throw runtime_error("Poll interval must be at least 1 ms");
        } else if (arg == "--stop-timeout-ms" && i + 1 < argc) {
            cfg.stopTimeoutMs = stoi(argv[++i]);
            if (cfg.stopTimeoutMs < 0) throw runtime_error("Stop timeout can't be negative");
        } else if (arg == "--ffmpeg" && i + 1 < argc) {
            cfg.ffmpeg = argv[++i];
        } else if (arg == "--max-concurrency" && i + 1 < argc) {
            cfg.maxConcurrency = max(1, stoi(argv[++i]));
        } else if (arg == "--debug") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-q" || arg == "--quiet") {
            spdlog::set_level(spdlog::level::off);
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            exit(0);
        } else {
            throw runtime_error("Unknown or incomplete option: " + arg);
        }
    }

    if (cfg.voicesDir.empty()) {
        throw runtime_error("Voices directory must be provided");
    }
    if (!filesystem::is_directory(cfg.voicesDir)) {
        throw runtime_error("Voices directory doesn't exist");
    }
    if (cfg.pauseMarker == cfg.stopMarker) {
        throw runtime_error("Pause and stop markers must be different files");
    }
}

int main(int argc, char *argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("speakd"));

    RunConfig cfg;
    shared_ptr<PiperGateway> synth;
    try {
        parseArgs(argc, argv, cfg);
        PiperGateway::InitOptions opts;
        opts.voicesDir = cfg.voicesDir;
        opts.eSpeakDataPath = cfg.eSpeakDataPath;
        opts.accelerator = cfg.accelerator;
        synth = make_shared<PiperGateway>(opts);
    } catch (const exception &e) {
        printError(e.what());
        return 1;
    }

    auto signals = make_shared<SignalBridge>(cfg.pauseMarker, cfg.stopMarker);
    PlaybackController::Options playbackOpts;
    playbackOpts.writer.format.sampleRate = synth->sampleRate();
    playbackOpts.writer.pollInterval = chrono::milliseconds(cfg.pollMs);
    playbackOpts.stopTimeout = chrono::milliseconds(cfg.stopTimeoutMs);

    auto outputs = [device = cfg.device, volume = cfg.volume]() -> unique_ptr<AudioOutput> {
        return make_unique<AlsaOutput>(device, volume);
    };
    PlaybackController playback(synth, outputs, signals, playbackOpts);
    SpeechExporter exporter(synth, cfg.ffmpeg);
    ToolServer server(playback, exporter);

    spdlog::info("speakd ready (voices in {}, markers {} / {})", cfg.voicesDir.string(),
                 cfg.pauseMarker.string(), cfg.stopMarker.string());

    mutex qMutex;
    condition_variable qCv;
    queue<string> q;
    mutex outMutex;

    // Signal handling for graceful shutdown
    auto handler = +[](int) { gShuttingDown.store(true); };
    signal(SIGINT, handler);
    signal(SIGTERM, handler);

    // Worker threads
    vector<thread> workers;
    workers.reserve(cfg.maxConcurrency);
    for (int i = 0; i < cfg.maxConcurrency; i++) {
        workers.emplace_back([&]() {
            while (true) {
                string line;
                {
                    unique_lock<mutex> lk(qMutex);
                    qCv.wait(lk, [&]() { return gShuttingDown.load() || !q.empty(); });
                    if (gShuttingDown.load() && q.empty()) return;
                    if (q.empty()) continue;
                    line = std::move(q.front());
                    q.pop();
                }
                auto response = server.handleLine(line);
                if (response) {
                    lock_guard<mutex> lk(outMutex);
                    cout << *response << '\n';
                    cout.flush();
                }
            }
        });
    }

    // Read requests from stdin (one JSON-RPC message per line)
    string line;
    while (!gShuttingDown.load() && getline(cin, line)) {
        if (line.empty()) continue;
        {
            unique_lock<mutex> lk(qMutex);
            q.push(std::move(line));
        }
        qCv.notify_one();
    }

    // Begin shutdown: reject new, finish in-flight
    gShuttingDown.store(true);
    qCv.notify_all();
    for (auto &t : workers) t.join();
    spdlog::info("{}", playback.stop());
    return 0;
}
