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

#include <cstddef>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "trash/trash-can.hxx"

namespace commandline::render
{
// 'ls -l' style mode string, 'drwxr-xr-x'
[[nodiscard]] std::string mode(const trash::entry::payload_metadata& metadata) noexcept;

// identifier with a marker for orphans and invalid records
[[nodiscard]] std::string display_name(const trash::entry& entry) noexcept;

// deletion date, or a placeholder of the same width if the record is invalid
[[nodiscard]] std::string deletion_date(const trash::entry& entry) noexcept;

// mode, size, deletion date, identifier and original path of an entry
[[nodiscard]] std::string long_line(const trash::entry& entry) noexcept;

/**
 * @brief grid
 *
 * - Lay out names in columns, filled top to bottom, like ls(1).
 *   Uses as few rows as fit into 'width', at least one column.
 *
 * @param[in] names The names to lay out
 * @param[in] width Terminal width in characters
 *
 * @return The grid, every row terminated by a newline
 */
[[nodiscard]] std::string grid(const std::span<const std::string> names, std::size_t width) noexcept;

// Listing of a single trash directory, the root followed by its entries
void trash_dir(std::ostream& out, const trash::trash_dir& trash_dir,
               const std::span<const trash::entry> entries, bool long_format,
               std::size_t width) noexcept;

// Width of the terminal on stdout, 80 if it is not a terminal
[[nodiscard]] std::size_t terminal_width() noexcept;
} // namespace commandline::render
