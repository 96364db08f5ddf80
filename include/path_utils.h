#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution and small file helpers for configuration
 */

#include "errors.h"
#include <string>

namespace voxlink {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Resolves `path` against the directory of `base_file` when `path` is relative.
 * Absolute and ~ paths are only expanded.
 */
std::string resolve_relative_to(const std::string& path, const std::string& base_file);

/**
 * Directory holding the running executable (from /proc/self/exe), or "" when
 * it cannot be determined.
 */
std::string executable_dir();

/**
 * Finds a config file given relative to the working directory, falling back
 * to <executable_dir>/../`relative`. Returns `relative` when neither exists.
 */
std::string locate_config_file(const std::string& relative);

/**
 * Reads a whole text file (e.g. a system instruction).
 */
Result<std::string> read_text_file(const std::string& path);

} // namespace voxlink
