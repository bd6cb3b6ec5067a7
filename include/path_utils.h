#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion
 */

#include <string>

namespace orbion {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

} // namespace orbion
