#pragma once

#include "errors.h"
#include <functional>
#include <string>
#include <vector>

namespace voxlink {

class LLMClient;

/**
 * @brief Supplies topic tags for free text; failures yield an empty list
 */
class TagExtractor {
public:
    using Callback = std::function<void(std::vector<std::string> tags)>;

    virtual ~TagExtractor() = default;
    virtual void extract_tags(const std::string& text, Callback callback) = 0;
};

/// Parse a JSON array of strings; non-string items are skipped
Result<std::vector<std::string>> parse_tag_list(const std::string& json_text);

class LlmTagExtractor : public TagExtractor {
public:
    explicit LlmTagExtractor(LLMClient& client);

    void extract_tags(const std::string& text, Callback callback) override;

private:
    LLMClient& client_;
};

} // namespace voxlink
