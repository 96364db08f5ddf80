#include "tools/retrieve_memory_tool.h"
#include "logger.h"
#include "memory/memory_store_client.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voxlink {

RetrieveMemoryTool::RetrieveMemoryTool(MemoryStoreClient& memory) : memory_(memory) {}

std::string RetrieveMemoryTool::parameter_schema() const {
    json schema;
    schema["type"] = "OBJECT";
    schema["properties"]["query"] = json::object({
        {"type", "STRING"},
        {"description", "The search query."}
    });
    schema["required"] = json::array({"query"});
    return schema.dump();
}

void RetrieveMemoryTool::execute(const std::string& params_json, Callback callback) {
    std::string query;
    try {
        json params = json::parse(params_json);
        if (params.contains("query") && params["query"].is_string()) {
            query = params["query"].get<std::string>();
        }
    } catch (const json::exception& e) {
        Logger::error("RetrieveMemoryTool: JSON parse error: " + std::string(e.what()));
        callback(ToolResult::error_result("Invalid JSON parameters: " + std::string(e.what())));
        return;
    }

    memory_.search_memories(query, {}, [callback](const std::vector<MemoryRecord>& records) {
        callback(ToolResult::success_result(format_memories_for_prompt(records)));
    });
}

} // namespace voxlink
