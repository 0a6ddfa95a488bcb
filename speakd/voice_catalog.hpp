#pragma once

#include <string>
#include <vector>

namespace speakd {

constexpr const char* kDefaultVoice = "af_heart";

struct VoiceGroup {
    std::string label;
    std::vector<std::string> voices;
};

// Fixed, ordered catalog. Does not depend on which voice models are installed.
const std::vector<VoiceGroup>& voiceCatalog();

// Strips surrounding whitespace and a catalog suffix: "af_heart (default)" -> "af_heart"
std::string baseVoiceName(const std::string& voice);

} // namespace speakd
