#include "tools/commit_memory_tool.h"
#include "context/tag_extractor.h"
#include "logger.h"
#include "memory/memory_store_client.h"
#include "session/event_log.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

CommitMemoryTool::CommitMemoryTool(MemoryStoreClient& memory, TagExtractor& tagger, EventLog& log)
    : memory_(memory), tagger_(tagger), log_(log) {}

std::string CommitMemoryTool::parameter_schema() const {
    json schema;
    schema["type"] = "OBJECT";
    schema["properties"]["content"] = json::object({
        {"type", "STRING"},
        {"description", "The fact or information to be saved."}
    });
    schema["properties"]["category"] = json::object({
        {"type", "STRING"},
        {"description", "The category of the memory."}
    });
    schema["properties"]["tags"] = json::object({
        {"type", "ARRAY"},
        {"items", json::object({{"type", "STRING"}})},
        {"description", "Keywords."}
    });
    schema["required"] = json::array({"content", "category"});
    return schema.dump();
}

void CommitMemoryTool::execute(const std::string& params_json, Callback callback) {
    json params;
    try {
        params = json::parse(params_json);
    } catch (const json::exception& e) {
        Logger::error("CommitMemoryTool: JSON parse error: " + std::string(e.what()));
        callback(ToolResult::error_result("Invalid JSON parameters: " + std::string(e.what())));
        return;
    }

    if (!params.contains("content") || !params["content"].is_string()) {
        callback(ToolResult::error_result("Missing or invalid 'content' parameter"));
        return;
    }
    std::string content = params["content"].get<std::string>();
    std::string category = params.contains("category") && params["category"].is_string()
                               ? params["category"].get<std::string>()
                               : "General";

    std::vector<std::string> tags;
    if (params.contains("tags") && params["tags"].is_array()) {
        for (const auto& tag : params["tags"]) {
            if (tag.is_string()) {
                tags.push_back(tag.get<std::string>());
            }
        }
    }

    log_.add("MANUAL ARCHIVE [" + category + "]: " + content.substr(0, 30) + "...", Severity::Success);

    if (!tags.empty()) {
        archive(content, category, tags, callback);
        return;
    }
    tagger_.extract_tags(content, [this, content, category, callback](std::vector<std::string> extracted) {
        archive(content, category, extracted, callback);
    });
}

void CommitMemoryTool::archive(const std::string& content, const std::string& category,
                               const std::vector<std::string>& tags, Callback callback) {
    memory_.save_memory(content, category, tags, [callback](const std::string& id) {
        Logger::debug("CommitMemoryTool: stored as " + id);
        callback(ToolResult::success_result("Confirmed."));
    });
}

} // namespace voxlink
