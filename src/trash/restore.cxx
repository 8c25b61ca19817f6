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

#include <expected>
#include <filesystem>
#include <memory>
#include <string_view>
#include <system_error>

#include "logger.hxx"

#include "trash/error.hxx"
#include "trash/trash-can.hxx"
#include "trash/trashinfo.hxx"
#include "trash/utils/utils.hxx"

std::expected<trash::restored_item, std::error_code>
trash::trash_can::restore(const std::shared_ptr<trash::trash_dir>& trash_dir,
                          const std::string_view identifier) noexcept
{
    const auto info_path = trash_dir->info_path(identifier);
    const auto payload_path = trash_dir->payload_path(identifier);

    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(info_path, ec)))
    {
        logger::error<logger::domain::trash>("Missing {}", info_path.string());
        return std::unexpected(trash::error_code::info_missing);
    }

    const auto text = trash::utils::read_file(info_path);
    if (!text)
    {
        logger::error<logger::domain::trash>("Failed to read {}: {}",
                                             info_path.string(),
                                             text.error().message());
        return std::unexpected(trash::error_code::info_read_failed);
    }

    const auto info = trash::trashinfo::decode(*text);
    if (!info)
    {
        logger::error<logger::domain::trash>("Corrupt {}: {}",
                                             info_path.string(),
                                             info.error().message());
        return std::unexpected(trash::error_code::corrupt_record);
    }

    if (!std::filesystem::exists(std::filesystem::symlink_status(payload_path, ec)))
    {
        logger::error<logger::domain::trash>("Missing {}", payload_path.string());
        return std::unexpected(trash::error_code::payload_missing);
    }

    const auto& destination = info->path;

    // broken symlinks count as existing
    const auto status = std::filesystem::symlink_status(destination, ec);
    if (std::filesystem::exists(status))
    {
        logger::error<logger::domain::trash>("Restore target already exists: {}",
                                             destination.string());
        return std::unexpected(trash::error_code::destination_exists);
    }

    if (!std::filesystem::is_directory(destination.parent_path(), ec))
    {
        logger::error<logger::domain::trash>("Restore target directory is missing: {}",
                                             destination.parent_path().string());
        return std::unexpected(trash::error_code::destination_unavailable);
    }

    ec = this->move_payload(payload_path, destination);
    if (ec)
    {
        logger::error<logger::domain::trash>("Failed to restore {} to {}: {}",
                                             payload_path.string(),
                                             destination.string(),
                                             ec.message());
        if (ec == std::errc::file_exists)
        { // created after the check above, never replaced
            return std::unexpected(trash::error_code::destination_exists);
        }
        if (ec == std::errc::cross_device_link)
        {
            return std::unexpected(trash::error_code::cross_device);
        }
        return std::unexpected(trash::error_code::restore_failed);
    }

    logger::info<logger::domain::trash>("Restored {} -> {}",
                                        payload_path.string(),
                                        destination.string());

    trash::restored_item item{.path = destination, .cleanup = {}};

    std::filesystem::remove(info_path, ec);
    if (ec)
    {
        logger::warn<logger::domain::trash>("Failed to remove {}: {}",
                                            info_path.string(),
                                            ec.message());
        item.cleanup = trash::error_code::info_cleanup_failed;
    }

    return item;
}

std::expected<trash::restored_item, std::error_code>
trash::trash_can::restore(const trash::entry& entry) noexcept
{
    return this->restore(entry.dir, entry.identifier);
}
