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

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <stdio.h>

#include "logger.hxx"

#include "trash/error.hxx"
#include "trash/trash-can.hxx"
#include "trash/trashinfo.hxx"
#include "trash/utils/utils.hxx"

trash::trash_can::trash_can(const trash::user& user,
                            const std::shared_ptr<const trash::mount_table>& table) noexcept
    : locator_(user, table)
{
}

trash::locator&
trash::trash_can::locator() noexcept
{
    return this->locator_;
}

std::vector<std::shared_ptr<trash::trash_dir>>
trash::trash_can::trash_dirs() noexcept
{
    return this->locator_.enumerate_known();
}

std::error_code
trash::trash_can::move_payload(const std::filesystem::path& from,
                               const std::filesystem::path& to) noexcept
{
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0)
    {
        return {};
    }
    if (errno != EINVAL && errno != ENOSYS)
    {
        return std::error_code(errno, std::generic_category());
    }

    // filesystem without RENAME_NOREPLACE support
    logger::debug<logger::domain::trash>("renameat2 unsupported for {}", to.string());

    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(to, ec)))
    {
        return std::make_error_code(std::errc::file_exists);
    }
    std::filesystem::rename(from, to, ec);
    return ec;
}

bool
trash::trash_can::is_trash_path(const std::filesystem::path& path,
                                const std::shared_ptr<trash::trash_dir>& target) noexcept
{
    if (trash::utils::is_within(path, target->root()) ||
        trash::utils::is_within(path, this->locator_.user().home_trash()))
    {
        return true;
    }

    for (const auto& trash_dir : this->locator_.enumerate_known())
    {
        if (trash::utils::is_within(path, trash_dir->root()))
        {
            return true;
        }
    }
    return false;
}

std::expected<std::string, std::error_code>
trash::trash_can::create_trash_info(const std::shared_ptr<trash::trash_dir>& trash_dir,
                                    const std::filesystem::path& path, bool is_directory,
                                    const std::chrono::local_seconds deletion_date) const noexcept
{
    const auto parts = trash::utils::split_basename_extension(path.filename(), is_directory);
    const auto content = trash::trashinfo::encode(path, deletion_date);

    for (std::uint32_t n = 1; n < std::numeric_limits<std::uint32_t>::max(); ++n)
    {
        const auto identifier = trash::utils::numbered_name(parts, n, ".");

        std::error_code ec;
        if (std::filesystem::exists(std::filesystem::symlink_status(trash_dir->payload_path(identifier), ec)))
        {
            continue;
        }

        ec = trash::utils::write_file_exclusive(trash_dir->info_path(identifier),
                                                content,
                                                std::filesystem::perms::owner_read |
                                                    std::filesystem::perms::owner_write);
        if (ec == std::errc::file_exists)
        {
            // taken by another process since the check
            continue;
        }
        if (ec)
        {
            logger::error<logger::domain::trash>("Failed to write {}: {}",
                                                 trash_dir->info_path(identifier).string(),
                                                 ec.message());
            return std::unexpected(trash::error_code::info_write_failed);
        }
        return identifier;
    }

    logger::error<logger::domain::trash>("No free name in {} for {}",
                                         trash_dir->files().string(),
                                         path.filename().string());
    return std::unexpected(trash::error_code::info_write_failed);
}

std::expected<trash::trashed_item, std::error_code>
trash::trash_can::trash(const std::filesystem::path& path) noexcept
{
    if (path.empty())
    {
        return std::unexpected(trash::error_code::not_found);
    }

    const auto absolute = trash::utils::absolute_path(path);

    std::error_code ec;
    const auto status = std::filesystem::symlink_status(absolute, ec);
    if (!std::filesystem::exists(status))
    {
        logger::error<logger::domain::trash>("File does not exist: {}", absolute.string());
        return std::unexpected(trash::error_code::not_found);
    }
    if (absolute == absolute.root_path())
    {
        logger::error<logger::domain::trash>("Refusing to trash the root directory");
        return std::unexpected(trash::error_code::move_failed);
    }

    const auto trash_dir = this->locator_.locate(absolute);
    if (!trash_dir)
    {
        return std::unexpected(trash_dir.error());
    }

    if (this->is_trash_path(absolute, *trash_dir))
    {
        logger::warn<logger::domain::trash>("Refusing to trash a Trash Dir: {}", absolute.string());
        return std::unexpected(trash::error_code::already_in_trash);
    }

    const auto source_device = this->locator_.resolver().table().device(absolute);
    const auto trash_device = this->locator_.resolver().device((*trash_dir)->files());
    if (!source_device || !trash_device)
    {
        return std::unexpected(trash::error_code::path_resolution);
    }
    if (*source_device != *trash_device)
    {
        logger::error<logger::domain::trash>("{} is not on the same filesystem as {}",
                                             absolute.string(),
                                             (*trash_dir)->root().string());
        return std::unexpected(trash::error_code::cross_device);
    }

    ec = trash::locator::provision(*trash_dir);
    if (ec)
    {
        return std::unexpected(ec);
    }

    const auto deletion_date = trash::trashinfo::now();
    const auto identifier = this->create_trash_info(*trash_dir,
                                                    absolute,
                                                    std::filesystem::is_directory(status),
                                                    deletion_date);
    if (!identifier)
    {
        return std::unexpected(identifier.error());
    }

    const auto info_path = (*trash_dir)->info_path(*identifier);
    const auto target_path = (*trash_dir)->payload_path(*identifier);

    ec = this->move_payload(absolute, target_path);
    if (ec)
    {
        logger::error<logger::domain::trash>("Failed to move {} to {}: {}",
                                             absolute.string(),
                                             target_path.string(),
                                             ec.message());

        std::error_code remove_ec;
        std::filesystem::remove(info_path, remove_ec);
        if (remove_ec)
        {
            logger::warn<logger::domain::trash>("Left orphaned {}: {}",
                                                info_path.string(),
                                                remove_ec.message());
            return std::unexpected(trash::error_code::orphaned_info);
        }

        if (ec == std::errc::cross_device_link)
        {
            return std::unexpected(trash::error_code::cross_device);
        }
        return std::unexpected(trash::error_code::move_failed);
    }

    logger::info<logger::domain::trash>("Moved to trash: {} -> {}",
                                        absolute.string(),
                                        target_path.string());

    return trash::trashed_item{
        .dir = *trash_dir,
        .identifier = *identifier,
        .original = absolute,
        .deletion_date = deletion_date,
    };
}

std::vector<std::expected<trash::trashed_item, std::error_code>>
trash::trash_can::trash(const std::span<const std::filesystem::path> paths) noexcept
{
    std::vector<std::expected<trash::trashed_item, std::error_code>> results;
    results.reserve(paths.size());
    for (const auto& path : paths)
    {
        results.push_back(this->trash(path));
    }
    return results;
}
