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

#include <string>

#include <system_error>

#include "trash/error.hxx"

const std::error_category&
trash::error_category() noexcept
{
    struct category final : std::error_category
    {
        const char*
        name() const noexcept override final
        {
            return "trash::error_category()";
        }

        std::string
        message(int c) const override final
        {
            switch (static_cast<trash::error_code>(c))
            {
                case trash::error_code::none:
                    return "none";
                case trash::error_code::path_resolution:
                    return "cannot determine the filesystem of the path";
                case trash::error_code::trash_symlink:
                    return "trash directory is a symbolic link";
                case trash::error_code::provision_failed:
                    return "cannot create the trash directory";
                case trash::error_code::no_trash_directories:
                    return "no trash directories found";
                case trash::error_code::not_found:
                    return "no such file or directory";
                case trash::error_code::already_in_trash:
                    return "item is already in the trash";
                case trash::error_code::cross_device:
                    return "trash directory is on a different filesystem";
                case trash::error_code::info_write_failed:
                    return "cannot write the trash info file";
                case trash::error_code::move_failed:
                    return "cannot move the item into the trash";
                case trash::error_code::orphaned_info:
                    return "cannot move the item into the trash and its trash info file was left behind";
                case trash::error_code::info_read_failed:
                    return "cannot read the trash info file";
                case trash::error_code::info_missing_header:
                    return "trash info file does not start with [Trash Info]";
                case trash::error_code::info_missing_path:
                    return "trash info file has no Path key";
                case trash::error_code::info_malformed_path:
                    return "trash info file has a malformed Path key";
                case trash::error_code::info_missing_date:
                    return "trash info file has no DeletionDate key";
                case trash::error_code::info_malformed_date:
                    return "trash info file has a malformed DeletionDate key";
                case trash::error_code::info_missing:
                    return "trashed item has no trash info file";
                case trash::error_code::corrupt_record:
                    return "trash info file is corrupt";
                case trash::error_code::payload_missing:
                    return "trashed item not found, the trash directory is inconsistent";
                case trash::error_code::destination_exists:
                    return "destination already exists";
                case trash::error_code::destination_unavailable:
                    return "destination directory does not exist";
                case trash::error_code::restore_failed:
                    return "cannot move the item out of the trash";
                case trash::error_code::info_cleanup_failed:
                    return "item restored but its trash info file could not be removed";
                case trash::error_code::payload_delete_failed:
                    return "cannot delete the trashed item";
                case trash::error_code::info_delete_failed:
                    return "cannot delete the trash info file";
                default:
                    return "unknown error";
            }
        }
    };
    static const category instance{};
    return instance;
}

bool
trash::is_record_error(const std::error_code& ec) noexcept
{
    if (ec.category() != trash::error_category())
    {
        return false;
    }

    switch (static_cast<trash::error_code>(ec.value()))
    {
        case trash::error_code::info_missing_header:
        case trash::error_code::info_missing_path:
        case trash::error_code::info_malformed_path:
        case trash::error_code::info_missing_date:
        case trash::error_code::info_malformed_date:
            return true;
        default:
            return false;
    }
}
