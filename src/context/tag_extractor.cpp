#include "context/tag_extractor.h"
#include "llm_client.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

namespace {

const char* kTaggingPrompt =
    "Read the text for meaning and extract its main topics as tags. "
    "Reply with a JSON list of tags: [\"tag\",\"tag\",...]";

} // namespace

Result<std::vector<std::string>> parse_tag_list(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        return make_parse_error("Tag JSON: " + std::string(e.what()));
    }
    std::vector<std::string> tags;
    if (!j.is_array()) return tags;
    for (const auto& item : j) {
        if (item.is_string()) tags.push_back(item.get<std::string>());
    }
    return tags;
}

LlmTagExtractor::LlmTagExtractor(LLMClient& client) : client_(client) {}

void LlmTagExtractor::extract_tags(const std::string& text, Callback callback) {
    if (!client_.is_ready() || utils::is_empty_or_whitespace(text)) {
        callback({});
        return;
    }

    std::string prompt = std::string(kTaggingPrompt) + "\n\nText to analyze: \"" + text + "\"";
    json schema = {{"type", "ARRAY"}, {"items", {{"type", "STRING"}}}};

    client_.generate_json_async(prompt, schema, [callback](Result<std::string> reply) {
        if (!reply) {
            Logger::warn("[Context] Tag extraction failed: " + describe(reply.error()));
            callback({});
            return;
        }
        auto tags = parse_tag_list(reply.value());
        if (!tags) {
            Logger::warn("[Context] Tag extraction failed: " + describe(tags.error()));
            callback({});
            return;
        }
        callback(tags.value());
    });
}

} // namespace voxlink
