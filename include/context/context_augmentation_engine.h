#pragma once

#include "context/intent_classifier.h"
#include <functional>
#include <optional>
#include <string>

namespace voxlink {

class MemoryStoreClient;

struct AugmentationResult {
    /// Text to feed back into the live conversation
    std::optional<std::string> injection;
    /// Analysis line for the session log
    std::optional<std::string> log;
};

/**
 * @brief Classify a completed utterance and run the memory operation it implies
 *
 * SAVE archives saveData and yields a confirmation alert; RETRIEVE searches
 * and yields either formatted records or a "no data" alert; NONE yields
 * nothing. A classifier failure yields only an error log line. The callback is
 * always invoked exactly once.
 */
class ContextAugmentationEngine {
public:
    using Callback = std::function<void(AugmentationResult)>;

    ContextAugmentationEngine(IntentClassifier& classifier, MemoryStoreClient& memory);

    void process(const std::string& utterance, Callback callback);

private:
    void handle_save(const SaveData& data, std::string log, Callback callback);
    void handle_retrieve(const SearchData& data, std::string log, Callback callback);

    IntentClassifier& classifier_;
    MemoryStoreClient& memory_;
};

} // namespace voxlink
