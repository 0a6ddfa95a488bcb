#include "speech_text.hpp"

#include <fmt/format.h>

using namespace std;

namespace speakd {

size_t codePointCount(const string& text) {
    size_t n = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

string padShortText(const string& text) {
    if (codePointCount(text) < kShortTextThreshold) {
        return text + kShortTextPad;
    }
    return text;
}

namespace {

bool isSeparator(char32_t cp) {
    switch (cp) {
    case 0x85: case 0xA0: case 0x1680: case 0x2028: case 0x2029:
    case 0x202F: case 0x205F: case 0x3000:
        return true;
    default:
        return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) || (cp >= 0x2000 && cp <= 0x200A);
    }
}

// Decodes one UTF-8 sequence at text[i] and advances i. Malformed bytes decode as themselves.
char32_t nextCodePoint(const string& text, size_t& i) {
    const auto lead = static_cast<unsigned char>(text[i++]);
    int extra = lead >= 0xF0 ? 3 : lead >= 0xE0 ? 2 : lead >= 0xC0 ? 1 : 0;
    char32_t cp = extra == 3 ? (lead & 0x07) : extra == 2 ? (lead & 0x0F) : extra == 1 ? (lead & 0x1F) : lead;
    for (; extra > 0 && i < text.size(); extra--) {
        const auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) break;
        cp = (cp << 6) | (c & 0x3F);
        i++;
    }
    return cp;
}

} // namespace

size_t wordCount(const string& text) {
    size_t words = 0;
    bool inWord = false;
    for (size_t i = 0; i < text.size();) {
        if (isSeparator(nextCodePoint(text, i))) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            words++;
        }
    }
    return words;
}

string formatSpeed(double speed) {
    auto s = fmt::format("{}", speed);
    if (s.find_first_of(".eni") == string::npos) s += ".0";
    return s;
}

} // namespace speakd
