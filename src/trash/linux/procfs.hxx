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

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace trash::linux::procfs
{
constexpr std::string_view MOUNTINFO = "/proc/self/mountinfo";

struct mountinfo_entry final
{
    unsigned long mount_id;
    unsigned long parent_id;
    unsigned int major;
    unsigned int minor;
    std::string root;
    std::filesystem::path mount_point;
    std::string mount_options;
    std::string optional_fields;
    std::string filesystem_type;
    std::string mount_source;
    std::string super_options;
};

/**
 * @brief mountinfo
 *
 * - Parse a mountinfo table, see proc_pid_mountinfo(5). Malformed lines are logged
 *   and skipped.
 *
 * @param[in] stream An open mountinfo stream
 *
 * @return All well formed entries, in table order
 */
[[nodiscard]] std::vector<mountinfo_entry> mountinfo(std::istream& stream) noexcept;

// Read the mount table of the current process
[[nodiscard]] std::vector<mountinfo_entry> mountinfo() noexcept;
} // namespace trash::linux::procfs
