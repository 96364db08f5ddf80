#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace voxlink {

/**
 * @brief One archived fact. Immutable once created; id is assigned by the
 * backend (or "offline-id-<ms>" when the backend was unreachable).
 */
struct MemoryRecord {
    std::string id;
    std::string content;
    std::string category;
    std::vector<std::string> tags;
    int64_t created_ms = 0;
};

/**
 * @brief Client-side search over a full record set
 *
 * A record matches when the trimmed query is a case-insensitive substring of
 * its content, category or any tag, or when any search tag is a
 * case-insensitive substring of any record tag. Matches are sorted newest
 * first and capped at `limit`. Empty query with no tags returns nothing.
 */
std::vector<MemoryRecord> search_records(const std::vector<MemoryRecord>& records,
                                         const std::string& query,
                                         const std::vector<std::string>& tags,
                                         size_t limit);

/// True when a search would be vacuous (blank query, no tags)
bool is_vacuous_query(const std::string& query, const std::vector<std::string>& tags);

/// Sentinel rendered for an empty record set
extern const char* const kNoArchiveData;

/**
 * @brief "[ARCHIVE:{id} | {category}] {content}" per line, in the given order
 */
std::string format_memories_for_prompt(const std::vector<MemoryRecord>& records);

} // namespace voxlink
