#include "tool_registry.h"
#include "logger.h"

using json = nlohmann::json;

namespace voxlink {

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        Logger::error("Attempted to register null tool");
        return false;
    }

    std::string name = tool->name();
    if (tools_.find(name) != tools_.end()) {
        Logger::warn("Tool '" + name + "' is already registered. Skipping.");
        return false;
    }

    json parameters;
    try {
        parameters = json::parse(tool->parameter_schema());
    } catch (const json::exception& e) {
        Logger::error("Tool '" + name + "' has an invalid parameter schema: " + e.what());
        return false;
    }
    if (!parameters.is_object()) {
        Logger::error("Tool '" + name + "' parameter schema is not an object");
        return false;
    }

    tools_[name] = Entry{tool, parameters};
    Logger::info("Registered tool: " + name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::get_tool(const std::string& name) const {
    auto it = tools_.find(name);
    return it != tools_.end() ? it->second.tool : nullptr;
}

std::vector<std::string> ToolRegistry::get_tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        names.push_back(name);
    }
    return names;
}

std::string ToolRegistry::get_function_declarations_json() const {
    json declarations = json::array();
    for (const auto& [name, entry] : tools_) {
        declarations.push_back({
            {"name", name},
            {"description", entry.tool->description()},
            {"parameters", entry.parameters}
        });
    }
    return declarations.dump();
}

void ToolRegistry::dispatch(const std::string& name, const std::string& args_json,
                            Tool::Callback callback) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        Logger::warn("Unknown tool requested: " + name);
        callback(ToolResult::error_result("Unknown tool: " + name));
        return;
    }
    it->second.tool->execute(args_json.empty() ? "{}" : args_json, std::move(callback));
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

} // namespace voxlink
