#pragma once

#include <optional>
#include <random>
#include <string>
#include <vector>

namespace voxlink {

/// Built-in system instruction used when none is configured
const std::string& default_system_instruction();

/// Built-in filler phrases sent while augmentation runs
const std::vector<std::string>& default_thinking_prompts();

/// Uniform pick from `prompts` (built-in set when empty)
std::string pick_thinking_prompt(const std::vector<std::string>& prompts, std::mt19937& rng);

/**
 * @brief Follow-up instruction sent once augmentation finishes
 *
 * With an injection: the injected context, a blank line, then an instruction
 * to answer `user_text`. Without: a "no archival data" marker and the same
 * instruction.
 */
std::string build_followup_prompt(const std::optional<std::string>& injection, const std::string& user_text);

} // namespace voxlink
