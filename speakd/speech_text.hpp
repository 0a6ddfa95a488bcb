#pragma once

#include <cstddef>
#include <string>

namespace speakd {

constexpr size_t kShortTextThreshold = 25;
constexpr const char* kShortTextPad = " ... ...";

// Very short utterances make some output devices hang, so they get a filler
// suffix. Length is measured in code points, not bytes.
std::string padShortText(const std::string& text);

size_t codePointCount(const std::string& text);
// Words are separated by runs of Unicode whitespace, including NBSP and U+3000
size_t wordCount(const std::string& text);

// 1 -> "1.0", 1.25 -> "1.25"
std::string formatSpeed(double speed);

} // namespace speakd
