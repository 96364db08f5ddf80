#include "context/intent_classifier.h"
#include "llm_client.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

namespace {

const char* kClassifierPrompt = R"(You are the analysis module of a droid's memory core. Classify the user's incoming request and structure its data.

1. Analyze the user's text.
2. Decide the INTENT:
   - "SAVE": the user states a fact about themselves, a rule, a preference, or information worth remembering.
   - "RETRIEVE": the user asks about the past, asks to recall something, or the question needs context from the knowledge base.
   - "NONE": ordinary conversation, greetings, emotions that need no memory work.

3. Fill the JSON according to the intent:

IF "SAVE":
- content: the essence of the information to store, stripped of filler words.
- category: a category chosen from the meaning of the text.
- tags: 3-5 key tags for concepts that occur in the text.

IF "RETRIEVE":
- query: a search query optimized for the knowledge base.
- tags: tags for associative search.

IF "NONE":
- return intent "NONE".

Reply with JSON ONLY.
Schema:
{
  "intent": "SAVE" | "RETRIEVE" | "NONE",
  "saveData": { "content": "string", "category": "string", "tags": ["string"] } | null,
  "searchData": { "query": "string", "tags": ["string"] } | null
})";

json classification_schema() {
    json string_array = {{"type", "ARRAY"}, {"items", {{"type", "STRING"}}}};
    return {
        {"type", "OBJECT"},
        {"properties", {
            {"intent", {{"type", "STRING"}, {"enum", {"SAVE", "RETRIEVE", "NONE"}}}},
            {"saveData", {
                {"type", "OBJECT"},
                {"nullable", true},
                {"properties", {
                    {"content", {{"type", "STRING"}}},
                    {"category", {{"type", "STRING"}}},
                    {"tags", string_array}
                }}
            }},
            {"searchData", {
                {"type", "OBJECT"},
                {"nullable", true},
                {"properties", {
                    {"query", {{"type", "STRING"}}},
                    {"tags", string_array}
                }}
            }}
        }},
        {"required", {"intent"}}
    };
}

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::string string_field(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

} // namespace

const char* intent_name(Intent intent) {
    switch (intent) {
        case Intent::Save: return "SAVE";
        case Intent::Retrieve: return "RETRIEVE";
        case Intent::None: return "NONE";
        default: return "NONE";
    }
}

Result<Classification> parse_classification(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        return make_parse_error("Classifier JSON: " + std::string(e.what()));
    }
    if (!j.is_object()) {
        return make_parse_error("Classifier reply is not an object");
    }

    Classification result;
    std::string intent = string_field(j, "intent");
    if (intent == "SAVE") {
        result.intent = Intent::Save;
    } else if (intent == "RETRIEVE") {
        result.intent = Intent::Retrieve;
    } else {
        result.intent = Intent::None;
    }

    if (j.contains("saveData") && j["saveData"].is_object()) {
        const json& s = j["saveData"];
        SaveData data;
        data.content = string_field(s, "content");
        data.category = string_field(s, "category");
        data.tags = string_list(s, "tags");
        result.save_data = data;
    }
    if (j.contains("searchData") && j["searchData"].is_object()) {
        const json& s = j["searchData"];
        SearchData data;
        data.query = string_field(s, "query");
        data.tags = string_list(s, "tags");
        result.search_data = data;
    }
    return result;
}

LlmIntentClassifier::LlmIntentClassifier(LLMClient& client) : client_(client) {}

std::string LlmIntentClassifier::build_prompt(const std::string& utterance) {
    return std::string(kClassifierPrompt) + "\n\nIncoming request: \"" + utterance + "\"";
}

void LlmIntentClassifier::classify(const std::string& utterance, Callback callback) {
    client_.generate_json_async(build_prompt(utterance), classification_schema(),
        [callback](Result<std::string> text) {
            if (!text) {
                callback(text.error());
                return;
            }
            callback(parse_classification(text.value()));
        });
}

} // namespace voxlink
