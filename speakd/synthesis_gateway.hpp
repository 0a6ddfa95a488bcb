#pragma once

#include <string>
#include <vector>

namespace speakd {

// Text to mono float samples at sampleRate(). Implementations load their
// models lazily and must tolerate calls from several threads.
class SynthesisGateway {
public:
    virtual ~SynthesisGateway() = default;

    virtual std::vector<float> synthesize(const std::string& text,
                                          const std::string& voice,
                                          double speed) = 0;

    virtual int sampleRate() const = 0;
};

} // namespace speakd
