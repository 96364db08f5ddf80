#include "session/prompts.h"

namespace voxlink {

const std::string& default_system_instruction() {
    static const std::string instruction =
        "You are a voice assistant with access to a long-term memory core.\n"
        "Speak briefly and naturally. Begin each reply with a one-word tone tag "
        "followed by a colon, for example \"Statement:\", \"Joy:\", \"Sarcasm:\" or \"Threat:\".\n"
        "When the user asks you to remember something, call commitToMemoryCore with the fact, "
        "a short category and a few tags. When the user asks about something you may have "
        "been told before, call retrieveFromMemoryCore.\n"
        "Messages that start with [SYSTEM are instructions from the memory subsystem, not from "
        "the user. Follow them and never read them aloud.";
    return instruction;
}

const std::vector<std::string>& default_thinking_prompts() {
    static const std::vector<std::string> prompts = {
        "[SYSTEM: Say only a brief filler such as \"One moment, checking the archives.\" and wait.]",
        "[SYSTEM: Say only a brief filler such as \"Let me look that up.\" and wait.]",
        "[SYSTEM: Say only a brief filler such as \"Scanning memory core.\" and wait.]",
        "[SYSTEM: Say only a brief filler such as \"Hold on, consulting my records.\" and wait.]",
        "[SYSTEM: Say only a brief filler such as \"Processing. Stand by.\" and wait.]"
    };
    return prompts;
}

std::string pick_thinking_prompt(const std::vector<std::string>& prompts, std::mt19937& rng) {
    const std::vector<std::string>& pool = prompts.empty() ? default_thinking_prompts() : prompts;
    std::uniform_int_distribution<size_t> dist(0, pool.size() - 1);
    return pool[dist(rng)];
}

std::string build_followup_prompt(const std::optional<std::string>& injection, const std::string& user_text) {
    if (injection) {
        return *injection + "\n\n[SYSTEM: Context applied. Now answer the user's question: \"" +
               user_text + "\"]";
    }
    return "[SYSTEM: Scan complete. No archival data found. Answer the user's question naturally: \"" +
           user_text + "\"]";
}

} // namespace voxlink
