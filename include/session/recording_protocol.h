#pragma once

#include <string>
#include <vector>

namespace voxlink {

struct PhraseMatch {
    bool found = false;
    std::string phrase;  ///< the phrase as configured
    std::string before;  ///< text preceding the match
    std::string after;   ///< text following the match
};

/**
 * @brief Earliest case-insensitive occurrence of any phrase in `text`
 *
 * Matching folds ASCII and Cyrillic case. Empty phrases never match.
 */
PhraseMatch find_phrase(const std::string& text, const std::vector<std::string>& phrases);

} // namespace voxlink
