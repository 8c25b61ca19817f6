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
#include <string>
#include <system_error>
#include <vector>

#include <cerrno>

#include <sys/stat.h>
#include <sys/types.h>

#include "logger.hxx"

#include "trash/error.hxx"
#include "trash/linux/procfs.hxx"
#include "trash/mount.hxx"
#include "trash/utils/utils.hxx"

std::vector<std::filesystem::path>
trash::procfs_mount_table::mounts() const noexcept
{
    std::vector<std::filesystem::path> mounts;
    for (const auto& mount : trash::linux::procfs::mountinfo())
    {
        mounts.push_back(mount.mount_point);
    }
    return mounts;
}

std::expected<dev_t, std::error_code>
trash::procfs_mount_table::device(const std::filesystem::path& path) const noexcept
{
    struct stat statbuf;
    if (::lstat(path.c_str(), &statbuf) != 0)
    {
        return std::unexpected(std::error_code(errno, std::generic_category()));
    }
    return statbuf.st_dev;
}

/////////////////////////////

trash::mount_resolver::mount_resolver(const std::shared_ptr<const mount_table>& table) noexcept
    : table_(table)
{
}

const trash::mount_table&
trash::mount_resolver::table() const noexcept
{
    return *this->table_;
}

std::expected<std::filesystem::path, std::error_code>
trash::mount_resolver::existing_ancestor(const std::filesystem::path& path) const noexcept
{
    auto current = trash::utils::absolute_path(path);
    while (true)
    {
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(current, ec);
        if (std::filesystem::exists(status))
        {
            return current;
        }

        if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
        {
            logger::debug<logger::domain::mount>("cannot stat {}: {}", current.string(), ec.message());
            return std::unexpected(trash::error_code::path_resolution);
        }

        if (current == current.parent_path())
        {
            return std::unexpected(trash::error_code::path_resolution);
        }
        current = current.parent_path();
    }
}

std::expected<dev_t, std::error_code>
trash::mount_resolver::device(const std::filesystem::path& path) const noexcept
{
    const auto ancestor = this->existing_ancestor(path);
    if (!ancestor)
    {
        return std::unexpected(ancestor.error());
    }

    const auto device = this->table_->device(*ancestor);
    if (!device)
    {
        logger::debug<logger::domain::mount>("no device for {}: {}",
                                             ancestor->string(),
                                             device.error().message());
        return std::unexpected(trash::error_code::path_resolution);
    }
    return *device;
}

std::filesystem::path
trash::mount_resolver::toplevel(const std::filesystem::path& path, dev_t device) const noexcept
{
    std::filesystem::path mount_path = path;
    std::filesystem::path last_path = path;

    while (mount_path != mount_path.parent_path())
    {
        mount_path = mount_path.parent_path();
        const auto id = this->table_->device(mount_path);
        if (!id || *id != device)
        {
            break;
        }
        last_path = mount_path;
    }

    return last_path;
}

std::expected<trash::mount_point, std::error_code>
trash::mount_resolver::resolve(const std::filesystem::path& path) const noexcept
{
    const auto ancestor = this->existing_ancestor(path);
    if (!ancestor)
    {
        return std::unexpected(ancestor.error());
    }

    const auto device = this->table_->device(*ancestor);
    if (!device)
    {
        return std::unexpected(trash::error_code::path_resolution);
    }

    const auto absolute = trash::utils::absolute_path(path);

    // the longest mount point containing the path that is on the same device,
    // bind mounts and overmounts make shorter matches wrong
    std::filesystem::path topdir;
    for (const auto& mount : this->table_->mounts())
    {
        if (!trash::utils::is_within(absolute, mount))
        {
            continue;
        }
        if (mount.native().size() <= topdir.native().size())
        {
            continue;
        }
        const auto mount_device = this->table_->device(mount);
        if (mount_device && *mount_device == *device)
        {
            topdir = mount;
        }
    }

    if (topdir.empty())
    {
        topdir = this->toplevel(*ancestor, *device);
        logger::debug<logger::domain::mount>("no mount table entry for {}, using {}",
                                             absolute.string(),
                                             topdir.string());
    }


    return trash::mount_point{*device, topdir};
}
