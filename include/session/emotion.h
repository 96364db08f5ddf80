#pragma once

#include <string>

namespace voxlink {

/// Display state derived from the agent's leading "Word:" tag
enum class Emotion {
    Neutral,
    Threat,
    Happy,
    Suspicious
};

const char* emotion_name(Emotion emotion);

/**
 * @brief Map the leading `EmotionWord:` of an agent transcript to a display state
 *
 * Accepts optional `*` / `[` before the word and `*` / `]` after it; the word
 * is Latin or Cyrillic letters. No match, or an unknown word, is Neutral.
 */
Emotion extract_emotion(const std::string& agent_transcript);

} // namespace voxlink
