#pragma once

#include <functional>
#include <string>

namespace voxlink {

/**
 * @brief Result structure for tool execution
 */
struct ToolResult {
    bool success = false;
    std::string content;  // Result text returned to the model
    std::string error;    // Error message if failed

    static ToolResult success_result(const std::string& content) {
        ToolResult result;
        result.success = true;
        result.content = content;
        return result;
    }

    static ToolResult error_result(const std::string& error_msg) {
        ToolResult result;
        result.success = false;
        result.error = error_msg;
        return result;
    }
};

/**
 * @brief Abstract base class for functions the remote model may call
 *
 * Each tool provides:
 * - A unique name
 * - A description (for the model)
 * - A parameter schema in the speech service's schema dialect
 * - An asynchronous execute method; the callback runs on the session thread
 *   exactly once
 */
class Tool {
public:
    using Callback = std::function<void(ToolResult)>;

    virtual ~Tool() = default;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;

    /**
     * @brief Get the JSON schema for tool parameters
     */
    virtual std::string parameter_schema() const = 0;

    /**
     * @brief Execute the tool with given parameters
     * @param params_json JSON object with the call arguments
     */
    virtual void execute(const std::string& params_json, Callback callback) = 0;
};

} // namespace voxlink
