#pragma once

#include "tool.h"
#include <string>

namespace voxlink {

class EventLog;
class MemoryStoreClient;
class TagExtractor;

/**
 * @brief commitToMemoryCore(content, category, tags?)
 *
 * Archives a fact in the memory store. Missing tags are supplied by the tag
 * extractor. Answers "Confirmed." once the write has completed (or degraded
 * to an offline id).
 */
class CommitMemoryTool : public Tool {
public:
    CommitMemoryTool(MemoryStoreClient& memory, TagExtractor& tagger, EventLog& log);

    std::string name() const override { return "commitToMemoryCore"; }

    std::string description() const override {
        return "Saves a fact, rule, or piece of knowledge to long-term storage.";
    }

    std::string parameter_schema() const override;

    void execute(const std::string& params_json, Callback callback) override;

private:
    void archive(const std::string& content, const std::string& category,
                 const std::vector<std::string>& tags, Callback callback);

    MemoryStoreClient& memory_;
    TagExtractor& tagger_;
    EventLog& log_;
};

} // namespace voxlink
