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

#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "logger.hxx"

#include "trash/error.hxx"
#include "trash/locator.hxx"
#include "trash/utils/utils.hxx"

trash::locator::locator(const trash::user& user,
                        const std::shared_ptr<const trash::mount_table>& table) noexcept
    : user_(user), resolver_(table)
{
}

const trash::user&
trash::locator::user() const noexcept
{
    return this->user_;
}

const trash::mount_resolver&
trash::locator::resolver() const noexcept
{
    return this->resolver_;
}

std::optional<dev_t>
trash::locator::home_device() noexcept
{
    if (!this->home_device_)
    {
        const auto device = this->resolver_.device(this->user_.home_trash());
        if (!device)
        {
            logger::warn<logger::domain::trash>("Cannot resolve the home trash {}",
                                                this->user_.home_trash().string());
            return std::nullopt;
        }
        this->home_device_ = *device;
    }
    return this->home_device_;
}

bool
trash::locator::is_admin_trash(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (!std::filesystem::exists(status))
    {
        return false;
    }

    if (std::filesystem::is_symlink(status))
    {
        logger::warn<logger::domain::trash>("Ignoring admin trash, symbolic link: {}", path.string());
        return false;
    }
    if (!std::filesystem::is_directory(status))
    {
        logger::warn<logger::domain::trash>("Ignoring admin trash, not a directory: {}",
                                            path.string());
        return false;
    }
    if ((status.permissions() & std::filesystem::perms::sticky_bit) == std::filesystem::perms::none)
    {
        logger::warn<logger::domain::trash>("Ignoring admin trash, sticky bit not set: {}",
                                            path.string());
        return false;
    }
    return true;
}

bool
trash::locator::is_usable(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    return std::filesystem::is_directory(status) && !std::filesystem::is_symlink(status);
}

std::expected<std::shared_ptr<trash::trash_dir>, std::error_code>
trash::locator::locate(const std::filesystem::path& path) noexcept
{
    const auto mount = this->resolver_.resolve(path);
    if (!mount)
    {
        logger::error<logger::domain::trash>("Cannot resolve the filesystem of {}", path.string());
        return std::unexpected(mount.error());
    }

    if (this->trash_dirs_.contains(mount->device))
    {
        return this->trash_dirs_.at(mount->device);
    }

    std::shared_ptr<trash::trash_dir> trash_dir;

    const auto home_device = this->home_device();
    if (home_device && *home_device == mount->device)
    {
        trash_dir = std::make_shared<trash::trash_dir>(this->user_.home_trash(),
                                                       trash::trash_dir::kind::home,
                                                       mount->device);
    }
    else
    {
        // path on another device, cannot use $HOME trashcan
        const auto admin_trash = mount->topdir / ".Trash";
        if (is_admin_trash(admin_trash))
        {
            trash_dir = std::make_shared<trash::trash_dir>(admin_trash /
                                                               std::format("{}", this->user_.uid),
                                                           trash::trash_dir::kind::topdir_admin,
                                                           mount->device);
        }
        else
        {
            trash_dir = std::make_shared<trash::trash_dir>(
                mount->topdir / std::format(".Trash-{}", this->user_.uid),
                trash::trash_dir::kind::topdir_user,
                mount->device);
        }
    }

    if (trash_dir->is_symlink())
    {
        logger::error<logger::domain::trash>("Trash directory is a symbolic link: {}",
                                             trash_dir->root().string());
        return std::unexpected(trash::error_code::trash_symlink);
    }

    this->trash_dirs_[mount->device] = trash_dir;

    return trash_dir;
}

std::error_code
trash::locator::provision(const std::shared_ptr<trash::trash_dir>& trash_dir) noexcept
{
    return trash_dir->create();
}

std::expected<std::shared_ptr<trash::trash_dir>, std::error_code>
trash::locator::resolve_for(const std::filesystem::path& path) noexcept
{
    const auto trash_dir = this->locate(path);
    if (!trash_dir)
    {
        return std::unexpected(trash_dir.error());
    }

    const auto ec = provision(*trash_dir);
    if (ec)
    {
        return std::unexpected(ec);
    }
    return *trash_dir;
}

std::vector<std::shared_ptr<trash::trash_dir>>
trash::locator::enumerate_known() noexcept
{
    std::vector<std::shared_ptr<trash::trash_dir>> trash_dirs;

    const auto add = [this, &trash_dirs](const std::filesystem::path& path,
                                         trash::trash_dir::kind type)
    {
        if (!is_usable(path))
        {
            return;
        }

        const auto duplicate = std::ranges::any_of(trash_dirs,
                                                   [&path](const auto& trash_dir)
                                                   { return trash_dir->root() == path; });
        if (duplicate)
        {
            return;
        }

        const auto device = this->resolver_.table().device(path);
        if (!device)
        {
            logger::debug<logger::domain::trash>("Skipping {}: {}", path.string(), device.error().message());
            return;
        }

        // reuse the cached object so callers can compare by identity
        if (this->trash_dirs_.contains(*device) && this->trash_dirs_.at(*device)->root() == path)
        {
            trash_dirs.push_back(this->trash_dirs_.at(*device));
            return;
        }
        trash_dirs.push_back(std::make_shared<trash::trash_dir>(path, type, *device));
    };

    add(this->user_.home_trash(), trash::trash_dir::kind::home);

    for (const auto& mount : this->resolver_.table().mounts())
    {
        const auto admin_trash = mount / ".Trash";
        if (is_usable(admin_trash) && is_admin_trash(admin_trash))
        {
            add(admin_trash / std::format("{}", this->user_.uid),
                trash::trash_dir::kind::topdir_admin);
        }
        add(mount / std::format(".Trash-{}", this->user_.uid), trash::trash_dir::kind::topdir_user);
    }

    std::ranges::sort(trash_dirs,
                      [](const auto& a, const auto& b) { return a->root() < b->root(); });

    return trash_dirs;
}
