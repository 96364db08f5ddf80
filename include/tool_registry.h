#pragma once

#include "tool.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>
#include <map>

namespace voxlink {

/**
 * @brief Central registry for tools exposed to the remote model
 *
 * Owns the tools by name, renders the function declarations sent in the
 * session setup message, and routes incoming function calls.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with the registry
     * @return false if the tool is null, its name is taken, or its parameter
     *         schema is not a JSON object
     */
    bool register_tool(std::shared_ptr<Tool> tool);

    /**
     * @brief Get a tool by name
     * @return Shared pointer to tool, or nullptr if not found
     */
    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    std::vector<std::string> get_tool_names() const;

    /**
     * @brief Function declarations: [{name, description, parameters}, ...]
     */
    std::string get_function_declarations_json() const;

    /**
     * @brief Run the named tool; unknown names answer "Unknown tool: <name>"
     *
     * The callback is invoked exactly once, synchronously for unknown tools.
     */
    void dispatch(const std::string& name, const std::string& args_json, Tool::Callback callback) const;

    bool has_tool(const std::string& name) const;

    size_t size() const { return tools_.size(); }

private:
    struct Entry {
        std::shared_ptr<Tool> tool;
        nlohmann::json parameters;
    };

    std::map<std::string, Entry> tools_;
};

} // namespace voxlink
