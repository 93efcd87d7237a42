#pragma once
/**
 * @file paths.hpp
 * @brief Where Beacon keeps its files, and how it writes them safely.
 *
 * @details
 * - Config: `$XDG_CONFIG_HOME/beacon`, else `$HOME/.config/beacon`.
 * - Data:   `$XDG_DATA_HOME/beacon`,   else `$HOME/.local/share/beacon`.
 *
 * write_file_atomic() writes `<path>.tmp` and renames it over `<path>`, so a
 * crash or power cut mid-write leaves either the old file or the new one,
 * never half of each. That matters on field laptops running off batteries.
 */

#include <filesystem>
#include <string>

namespace beacon {

std::filesystem::path config_dir();
std::filesystem::path data_dir();

/**
 * @brief Replace @p path with @p content via tmp + rename.
 * Parent directories are created. Failures are logged; returns false.
 */
bool write_file_atomic(const std::filesystem::path& path, const std::string& content);

/// Whole file into @p out. False if it does not exist or cannot be read.
bool read_file(const std::filesystem::path& path, std::string& out);

} // namespace beacon
