#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and default data locations
 */

#include <string>

namespace parley {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Default directory for durable state when config leaves it empty.
 * $XDG_DATA_HOME/parley, else ~/.local/share/parley, else ./parley_data.
 */
std::string default_data_dir();

/**
 * Creates the directory (and parents) if missing.
 * @return false when the directory does not exist afterwards
 */
bool ensure_directory(const std::string& path);

} // namespace parley
