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

#include <system_error>
#include <type_traits>

namespace trash
{
enum class error_code : int
{
    none = 0,

    // resolution
    path_resolution,
    trash_symlink,
    provision_failed,
    no_trash_directories,

    // trashing
    not_found,
    already_in_trash,
    cross_device,
    info_write_failed,
    move_failed,
    orphaned_info,

    // .trashinfo records
    info_read_failed,
    info_missing_header,
    info_missing_path,
    info_malformed_path,
    info_missing_date,
    info_malformed_date,

    // restoring
    info_missing,
    corrupt_record,
    payload_missing,
    destination_exists,
    destination_unavailable,
    restore_failed,
    info_cleanup_failed,

    // purging
    payload_delete_failed,
    info_delete_failed,
};

[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] inline std::error_code
make_error_code(trash::error_code e) noexcept
{
    return {static_cast<int>(e), trash::error_category()};
}

// true for the codes that describe a malformed .trashinfo record
[[nodiscard]] bool is_record_error(const std::error_code& ec) noexcept;
} // namespace trash

template<> struct std::is_error_code_enum<trash::error_code> : public std::true_type
{
};
