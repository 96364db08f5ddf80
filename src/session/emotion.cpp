#include "session/emotion.h"
#include "utils.h"

namespace voxlink {

namespace {

// Length in bytes of the letter starting at `i`, or 0
size_t letter_length(const std::string& s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) return 1;
    if ((c == 0xD0 || c == 0xD1) && i + 1 < s.size()) {
        unsigned char n = static_cast<unsigned char>(s[i + 1]);
        if (n >= 0x80 && n <= 0xBF) return 2;
    }
    return 0;
}

} // namespace

const char* emotion_name(Emotion emotion) {
    switch (emotion) {
        case Emotion::Neutral: return "neutral";
        case Emotion::Threat: return "threat";
        case Emotion::Happy: return "happy";
        case Emotion::Suspicious: return "suspicious";
        default: return "unknown";
    }
}

Emotion extract_emotion(const std::string& agent_transcript) {
    std::string text = utils::trim_copy(agent_transcript);

    size_t i = 0;
    while (i < text.size() && (text[i] == '*' || text[i] == '[')) ++i;

    size_t word_start = i;
    while (i < text.size()) {
        size_t len = letter_length(text, i);
        if (len == 0) break;
        i += len;
    }
    if (i == word_start) return Emotion::Neutral;
    std::string word = utils::to_lower_utf8(text.substr(word_start, i - word_start));

    while (i < text.size() && (text[i] == '*' || text[i] == ']')) ++i;
    if (i >= text.size() || text[i] != ':') return Emotion::Neutral;

    if (word.find("threat") != std::string::npos || word.find("угроза") != std::string::npos) {
        return Emotion::Threat;
    }
    if (word.find("joy") != std::string::npos || word.find("happy") != std::string::npos ||
        word.find("радость") != std::string::npos) {
        return Emotion::Happy;
    }
    if (word.find("sarcasm") != std::string::npos || word.find("сарказм") != std::string::npos) {
        return Emotion::Suspicious;
    }
    return Emotion::Neutral;
}

} // namespace voxlink
