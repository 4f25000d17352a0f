#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion, executable lookup, temp files
 */

#include <string>

namespace holo_oracle {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Resolve an executable: an explicit path is returned if executable,
 * a bare name is searched on $PATH. Returns empty string if not found.
 */
std::string find_executable(const std::string& name_or_path);

/**
 * Create a unique temporary file path with the given suffix (file is created
 * empty so the name cannot be reused). Returns empty string on failure.
 */
std::string make_temp_path(const std::string& prefix, const std::string& suffix);

/**
 * True if a regular file exists at path.
 */
bool file_exists(const std::string& path);

} // namespace holo_oracle
