#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and environment lookups
 */

#include <string>
#include <vector>

namespace voxgate {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Names from `required` that are unset or empty in the environment.
 */
std::vector<std::string> missing_env_vars(const std::vector<std::string>& required);

} // namespace voxgate
