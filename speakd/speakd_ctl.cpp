// Drives a running speakd through its marker files only.

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "signal_bridge.hpp"

using namespace std;
using namespace speakd;

static void printUsage(const char *argv0) {
    cerr << "\nusage: " << argv0 << " [options] pause|resume|stop|state\n\n";
    cerr << "options:\n";
    cerr << "   --pause-marker FILE       pause marker path (default " << SignalBridge::kDefaultPausePath << ")\n";
    cerr << "   --stop-marker FILE        stop marker path (default " << SignalBridge::kDefaultStopPath << ")\n";
}

int main(int argc, char *argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_st("speakd-ctl"));

    filesystem::path pauseMarker = SignalBridge::kDefaultPausePath;
    filesystem::path stopMarker = SignalBridge::kDefaultStopPath;
    string command;

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if (arg == "--pause-marker" && i + 1 < argc) {
            pauseMarker = argv[++i];
        } else if (arg == "--stop-marker" && i + 1 < argc) {
            stopMarker = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (command.empty() && arg[0] != '-') {
            command = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    SignalBridge signals(pauseMarker, stopMarker);
    try {
        if (command == "pause") {
            signals.set(Marker::Pause);
        } else if (command == "resume") {
            signals.clear(Marker::Pause);
        } else if (command == "stop") {
            // The worker stops on the stop marker; dropping the pause lets it notice at once
            signals.set(Marker::Stop);
            signals.clear(Marker::Pause);
        } else if (command == "state") {
            cout << "pause=" << (signals.exists(Marker::Pause) ? "set" : "clear")
                 << " stop=" << (signals.exists(Marker::Stop) ? "set" : "clear") << '\n';
        } else {
            printUsage(argv[0]);
            return 2;
        }
    } catch (const exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
