#include "memory/memory_record.h"
#include "utils.h"
#include <algorithm>

namespace voxlink {

const char* const kNoArchiveData = "No data available in archives.";

bool is_vacuous_query(const std::string& query, const std::vector<std::string>& tags) {
    if (!utils::is_empty_or_whitespace(query)) return false;
    return std::all_of(tags.begin(), tags.end(),
                       [](const std::string& t) { return utils::is_empty_or_whitespace(t); });
}

std::vector<MemoryRecord> search_records(const std::vector<MemoryRecord>& records,
                                         const std::string& query,
                                         const std::vector<std::string>& tags,
                                         size_t limit) {
    std::vector<MemoryRecord> results;
    if (is_vacuous_query(query, tags)) return results;

    const std::string q = utils::trim_copy(query);
    std::vector<std::string> search_tags;
    for (const auto& t : tags) {
        std::string trimmed = utils::trim_copy(t);
        if (!trimmed.empty()) search_tags.push_back(trimmed);
    }

    for (const auto& record : records) {
        bool matched = false;
        if (!q.empty()) {
            matched = utils::contains_case_insensitive(record.content, q) ||
                      utils::contains_case_insensitive(record.category, q) ||
                      std::any_of(record.tags.begin(), record.tags.end(),
                                  [&q](const std::string& t) { return utils::contains_case_insensitive(t, q); });
        }
        if (!matched) {
            for (const auto& st : search_tags) {
                if (std::any_of(record.tags.begin(), record.tags.end(),
                                [&st](const std::string& t) { return utils::contains_case_insensitive(t, st); })) {
                    matched = true;
                    break;
                }
            }
        }
        if (matched) results.push_back(record);
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const MemoryRecord& a, const MemoryRecord& b) { return a.created_ms > b.created_ms; });
    if (results.size() > limit) results.resize(limit);
    return results;
}

std::string format_memories_for_prompt(const std::vector<MemoryRecord>& records) {
    if (records.empty()) return kNoArchiveData;
    std::string out;
    for (size_t i = 0; i < records.size(); ++i) {
        if (i > 0) out += '\n';
        out += "[ARCHIVE:" + records[i].id + " | " + records[i].category + "] " + records[i].content;
    }
    return out;
}

} // namespace voxlink
