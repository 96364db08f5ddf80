#include "context/context_augmentation_engine.h"
#include "logger.h"
#include "memory/memory_store_client.h"
#include "utils.h"

namespace voxlink {

ContextAugmentationEngine::ContextAugmentationEngine(IntentClassifier& classifier, MemoryStoreClient& memory)
    : classifier_(classifier), memory_(memory) {}

void ContextAugmentationEngine::process(const std::string& utterance, Callback callback) {
    if (utils::is_empty_or_whitespace(utterance)) {
        callback(AugmentationResult{});
        return;
    }

    classifier_.classify(utterance, [this, callback](Result<Classification> analysis) {
        if (!analysis) {
            Logger::error("[Context] Classifier failed: " + describe(analysis.error()));
            AugmentationResult result;
            result.log = "[ANALYSIS UNIT] Error processing context.";
            callback(result);
            return;
        }

        const Classification& c = analysis.value();
        std::string log = std::string("[ANALYSIS UNIT] Intent: ") + intent_name(c.intent);
        LOG_CONTEXT(log);

        if (c.intent == Intent::Save && c.save_data) {
            log += " | Category: " + c.save_data->category +
                   " | Tags: [" + utils::join(c.save_data->tags, ", ") + "]";
            handle_save(*c.save_data, log, callback);
            return;
        }
        if (c.intent == Intent::Retrieve && c.search_data) {
            log += " | Query: \"" + c.search_data->query +
                   "\" | Tags: [" + utils::join(c.search_data->tags, ", ") + "]";
            handle_retrieve(*c.search_data, log, callback);
            return;
        }

        AugmentationResult result;
        if (c.intent != Intent::None) {
            result.log = log;
        }
        callback(result);
    });
}

void ContextAugmentationEngine::handle_save(const SaveData& data, std::string log, Callback callback) {
    std::string category = data.category;
    std::vector<std::string> tags = data.tags;
    memory_.save_memory(data.content, data.category, data.tags,
        [callback, log, category, tags](const std::string&) {
            AugmentationResult result;
            result.log = log;
            result.injection = "[SYSTEM ALERT: New record saved to memory core. Category: " + category +
                               ". Tags: " + utils::join(tags, ", ") + "]";
            callback(result);
        });
}

void ContextAugmentationEngine::handle_retrieve(const SearchData& data, std::string log, Callback callback) {
    std::string query = data.query;
    memory_.search_memories(data.query, data.tags,
        [callback, log, query](const std::vector<MemoryRecord>& records) {
            AugmentationResult result;
            result.log = log;
            if (records.empty()) {
                result.injection = "[SYSTEM ALERT: No archive data found for query \"" + query + "\".]";
            } else {
                result.injection = "[SYSTEM DATA INJECTION: Memory records found for context]\n" +
                                   format_memories_for_prompt(records);
            }
            callback(result);
        });
}

} // namespace voxlink
