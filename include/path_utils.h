#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion, executable lookup and platform defaults
 */

#include <string>

namespace livetalk {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Returns platform-specific default espeak-ng data path when config leaves it empty.
 * macOS: /opt/homebrew/share/espeak-ng-data
 * Linux: first existing of the usual distro locations
 * Other: empty string
 */
std::string default_espeak_data_path();

/**
 * Resolve an executable name against $PATH.
 * Names containing '/' are returned unchanged when executable.
 * @return Absolute path, or empty string when nothing executable was found
 */
std::string find_executable(const std::string& name);

/**
 * Create a directory and all missing parents (mkdir -p). Returns false on failure.
 */
bool ensure_directory(const std::string& path);

} // namespace livetalk
