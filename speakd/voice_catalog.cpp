#include "voice_catalog.hpp"

namespace speakd {

const std::vector<VoiceGroup>& voiceCatalog() {
    static const std::vector<VoiceGroup> catalog = {
        {"American Female",
         {"af_heart (default)", "af_alloy", "af_aoede", "af_bella", "af_jessica", "af_kore",
          "af_nicole", "af_nova", "af_river", "af_sarah", "af_sky"}},
        {"American Male",
         {"am_adam", "am_echo", "am_eric", "am_fenrir", "am_liam", "am_michael", "am_onyx",
          "am_puck", "am_santa"}},
        {"British Female", {"bf_alice", "bf_emma", "bf_isabella", "bf_lily"}},
        {"British Male", {"bm_daniel", "bm_fable", "bm_george", "bm_lewis"}},
    };
    return catalog;
}

std::string baseVoiceName(const std::string& voice) {
    const auto begin = voice.find_first_not_of(" \t");
    if (begin == std::string::npos) return {};
    const auto end = voice.find_first_of(" \t(", begin);
    return voice.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
}

} // namespace speakd
