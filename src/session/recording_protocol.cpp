#include "session/recording_protocol.h"
#include "utils.h"

namespace voxlink {

PhraseMatch find_phrase(const std::string& text, const std::vector<std::string>& phrases) {
    PhraseMatch match;
    size_t best = std::string::npos;
    size_t best_len = 0;

    // Case folding keeps byte lengths, so offsets map back onto `text`
    std::string lowered = utils::to_lower_utf8(text);
    for (const auto& phrase : phrases) {
        if (phrase.empty()) continue;
        size_t pos = lowered.find(utils::to_lower_utf8(phrase));
        if (pos == std::string::npos) continue;
        if (best == std::string::npos || pos < best) {
            best = pos;
            best_len = phrase.size();
            match.phrase = phrase;
        }
    }

    if (best == std::string::npos) return match;
    match.found = true;
    match.before = text.substr(0, best);
    match.after = text.substr(best + best_len);
    return match;
}

} // namespace voxlink
