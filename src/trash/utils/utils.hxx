/**
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace trash::utils
{
/**
 * Make a path absolute without resolving its last component, so a symlink
 * names the link itself. Symlinks in the parent directories are resolved
 * where possible. Trailing slashes are removed.
 */
[[nodiscard]] std::filesystem::path absolute_path(const std::filesystem::path& path) noexcept;

// true if 'path' is 'parent' or lies below it, compared component by component
[[nodiscard]] bool is_within(const std::filesystem::path& path,
                             const std::filesystem::path& parent) noexcept;

struct split_basename_extension_data final
{
    std::string basename;
    std::string extension;
    bool is_multipart_extension;
};
/**
 * Split a filename into its basename and extension,
 * unlike using std::filesystem::path::filename/std::filesystem::path::extension
 * this will support multi part extensions such as .tar.gz,.tar.zst,etc..
 * directories never get an extension.
 */
[[nodiscard]] split_basename_extension_data
split_basename_extension(const std::filesystem::path& filename, bool is_directory) noexcept;

/**
 * @brief numbered_name
 *
 * - Build the n-th candidate name for a filename, the first candidate is the
 *   filename itself. Later candidates put the tag and counter between the
 *   basename and the extension, 'x.txt' -> 'x.2.txt' -> 'x.3.txt'.
 *
 * @param[in] parts The split filename
 * @param[in] n Candidate number, starting at 1
 * @param[in] tag String to be placed before the numeric counter
 *
 * @return The candidate filename
 */
[[nodiscard]] std::string numbered_name(const split_basename_extension_data& parts,
                                        std::uint32_t n, const std::string_view tag) noexcept;

[[nodiscard]] std::expected<std::string, std::error_code>
read_file(const std::filesystem::path& path) noexcept;

/**
 * @brief write_file_exclusive
 *
 * - Create a new file and write data to it, the data is flushed to disk before
 *   returning. Fails with std::errc::file_exists if the path is taken.
 *
 * @param[in] path The file to create
 * @param[in] data The file contents
 * @param[in] mode Permissions for the new file
 *
 * @return Empty on success
 */
[[nodiscard]] std::error_code write_file_exclusive(const std::filesystem::path& path,
                                                   const std::string_view data,
                                                   std::filesystem::perms mode) noexcept;
} // namespace trash::utils
