#pragma once

#include "tool.h"
#include <string>

namespace voxlink {

class MemoryStoreClient;

/**
 * @brief retrieveFromMemoryCore(query): formatted search results (or the
 * "no data" sentinel)
 */
class RetrieveMemoryTool : public Tool {
public:
    explicit RetrieveMemoryTool(MemoryStoreClient& memory);

    std::string name() const override { return "retrieveFromMemoryCore"; }

    std::string description() const override {
        return "Searches long-term memory for specific information.";
    }

    std::string parameter_schema() const override;

    void execute(const std::string& params_json, Callback callback) override;

private:
    MemoryStoreClient& memory_;
};

} // namespace voxlink
