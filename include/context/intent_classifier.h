#pragma once

#include "errors.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace voxlink {

class LLMClient;

enum class Intent {
    Save,
    Retrieve,
    None
};

const char* intent_name(Intent intent);

struct SaveData {
    std::string content;
    std::string category;
    std::vector<std::string> tags;
};

struct SearchData {
    std::string query;
    std::vector<std::string> tags;
};

struct Classification {
    Intent intent = Intent::None;
    std::optional<SaveData> save_data;
    std::optional<SearchData> search_data;
};

/**
 * @brief Parse the classifier's JSON reply
 *
 * Unknown or missing intent maps to None; saveData/searchData may be null.
 * Malformed JSON is a ParseError.
 */
Result<Classification> parse_classification(const std::string& json_text);

/**
 * @brief Decides whether an utterance should be archived, searched, or ignored
 */
class IntentClassifier {
public:
    using Callback = std::function<void(Result<Classification>)>;

    virtual ~IntentClassifier() = default;

    /// Callback runs on the session thread
    virtual void classify(const std::string& utterance, Callback callback) = 0;
};

/**
 * @brief Classifier backed by a structured-output LLM request
 */
class LlmIntentClassifier : public IntentClassifier {
public:
    explicit LlmIntentClassifier(LLMClient& client);

    void classify(const std::string& utterance, Callback callback) override;

    /// Prompt sent for one utterance
    static std::string build_prompt(const std::string& utterance);

private:
    LLMClient& client_;
};

} // namespace voxlink
