#include "signal_bridge.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

using namespace std;

namespace speakd {

SignalBridge::SignalBridge()
    : SignalBridge(kDefaultPausePath, kDefaultStopPath) {}

SignalBridge::SignalBridge(filesystem::path pausePath, filesystem::path stopPath)
    : pausePath_(std::move(pausePath)), stopPath_(std::move(stopPath)) {}

const filesystem::path& SignalBridge::path(Marker marker) const {
    return marker == Marker::Pause ? pausePath_ : stopPath_;
}

void SignalBridge::set(Marker marker) const {
    const auto& p = path(marker);
    ofstream touch(p, ios::app);
    if (!touch.is_open()) {
        throw runtime_error("Cannot create marker " + p.string());
    }
}

void SignalBridge::clear(Marker marker) const {
    const auto& p = path(marker);
    error_code ec;
    filesystem::remove(p, ec);
    if (ec) {
        spdlog::warn("Failed to remove marker {}: {}", p.string(), ec.message());
    }
}

bool SignalBridge::exists(Marker marker) const {
    error_code ec;
    return filesystem::exists(path(marker), ec);
}

void SignalBridge::clearAll() const {
    clear(Marker::Pause);
    clear(Marker::Stop);
}

} // namespace speakd
