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

#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

#include <magic_enum/magic_enum.hpp>

#include "logger.hxx"

#include "trash/error.hxx"
#include "trash/trash-dir.hxx"
#include "trash/trashinfo.hxx"

namespace
{
constexpr auto user_mode = std::filesystem::perms::owner_all;
constexpr auto shared_mode = std::filesystem::perms::all | std::filesystem::perms::sticky_bit;
} // namespace

trash::trash_dir::trash_dir(const std::filesystem::path& path, kind type, dev_t device) noexcept
    : trash_path_(path), kind_(type), device_(device)
{
    this->files_path_ = this->trash_path_ / "files";
    this->info_path_ = this->trash_path_ / "info";
}

const std::filesystem::path&
trash::trash_dir::root() const noexcept
{
    return this->trash_path_;
}

const std::filesystem::path&
trash::trash_dir::files() const noexcept
{
    return this->files_path_;
}

const std::filesystem::path&
trash::trash_dir::info() const noexcept
{
    return this->info_path_;
}

trash::trash_dir::kind
trash::trash_dir::type() const noexcept
{
    return this->kind_;
}

dev_t
trash::trash_dir::device() const noexcept
{
    return this->device_;
}

std::filesystem::path
trash::trash_dir::payload_path(const std::string_view identifier) const noexcept
{
    return this->files_path_ / identifier;
}

std::filesystem::path
trash::trash_dir::info_path(const std::string_view identifier) const noexcept
{
    return this->info_path_ / std::format("{}{}", identifier, trash::trashinfo::extension);
}

bool
trash::trash_dir::is_symlink() const noexcept
{
    std::error_code ec;
    return std::filesystem::is_symlink(std::filesystem::symlink_status(this->trash_path_, ec));
}

std::error_code
trash::trash_dir::create_root() const noexcept
{
    std::error_code ec;
    if (this->kind_ == kind::home)
    { // $XDG_DATA_HOME may not exist yet
        std::filesystem::create_directories(this->trash_path_.parent_path(), ec);
        if (ec)
        {
            logger::error<logger::domain::trash>("Failed to create {}: {}",
                                                 this->trash_path_.parent_path().string(),
                                                 ec.message());
            return trash::error_code::provision_failed;
        }
    }

    std::filesystem::create_directory(this->trash_path_, ec);
    if (ec)
    {
        logger::error<logger::domain::trash>("Failed to create {}: {}",
                                             this->trash_path_.string(),
                                             ec.message());
        return trash::error_code::provision_failed;
    }

    std::filesystem::permissions(this->trash_path_,
                                 user_mode,
                                 std::filesystem::perm_options::replace,
                                 ec);
    if (ec && this->kind_ != kind::home)
    {
        logger::warn<logger::domain::trash>("Cannot set mode 700 on {}: {}, trying 1777",
                                            this->trash_path_.string(),
                                            ec.message());
        std::filesystem::permissions(this->trash_path_,
                                     shared_mode,
                                     std::filesystem::perm_options::replace,
                                     ec);
    }
    if (ec)
    {
        logger::error<logger::domain::trash>("Failed to set permissions on {}: {}",
                                             this->trash_path_.string(),
                                             ec.message());
        return trash::error_code::provision_failed;
    }

    logger::info<logger::domain::trash>("Created {} trash directory {}",
                                        magic_enum::enum_name(this->kind_),
                                        this->trash_path_.string());
    return {};
}

std::error_code
trash::trash_dir::create_subdirs() const noexcept
{
    for (const auto& path : {this->files_path_, this->info_path_})
    {
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (std::filesystem::is_directory(status))
        {
            continue;
        }
        if (std::filesystem::exists(status))
        {
            logger::error<logger::domain::trash>("Not a directory: {}", path.string());
            return trash::error_code::provision_failed;
        }

        std::filesystem::create_directory(path, ec);
        if (!ec)
        {
            std::filesystem::permissions(path, user_mode, std::filesystem::perm_options::replace, ec);
        }
        if (ec)
        {
            logger::error<logger::domain::trash>("Failed to create {}: {}",
                                                 path.string(),
                                                 ec.message());
            return trash::error_code::provision_failed;
        }
    }
    return {};
}

std::error_code
trash::trash_dir::create() const noexcept
{
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(this->trash_path_, ec);
    if (std::filesystem::is_symlink(status))
    {
        logger::error<logger::domain::trash>("Refusing to use symlinked trash directory: {}",
                                             this->trash_path_.string());
        return trash::error_code::trash_symlink;
    }

    if (!std::filesystem::exists(status))
    {
        ec = this->create_root();
        if (ec)
        {
            return ec;
        }
    }
    else if (!std::filesystem::is_directory(status))
    {
        logger::error<logger::domain::trash>("Not a directory: {}", this->trash_path_.string());
        return trash::error_code::provision_failed;
    }

    return this->create_subdirs();
}
