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
#include <filesystem>
#include <string_view>
#include <system_error>

#include <sys/types.h>

namespace trash
{
// trash directories. There might be several on a system:
//
// One in $XDG_DATA_HOME/Trash or ~/.local/share/Trash
// if $XDG_DATA_HOME is not set
//
// Every other mountpoint can have $TOPLEVEL/.Trash/$UID, inside an admin created
// sticky $TOPLEVEL/.Trash, or $TOPLEVEL/.Trash-$UID.
class trash_dir final
{
  public:
    enum class kind : std::uint8_t
    {
        home,         // $XDG_DATA_HOME/Trash
        topdir_admin, // $topdir/.Trash/$uid
        topdir_user,  // $topdir/.Trash-$uid
    };

    trash_dir() = delete;
    trash_dir(const std::filesystem::path& path, kind type, dev_t device) noexcept;
    ~trash_dir() = default;
    trash_dir(const trash_dir& other) = delete;
    trash_dir(trash_dir&& other) = delete;
    trash_dir& operator=(const trash_dir& other) = delete;
    trash_dir& operator=(trash_dir&& other) = delete;

    [[nodiscard]] const std::filesystem::path& root() const noexcept;
    [[nodiscard]] const std::filesystem::path& files() const noexcept;
    [[nodiscard]] const std::filesystem::path& info() const noexcept;
    [[nodiscard]] kind type() const noexcept;
    [[nodiscard]] dev_t device() const noexcept;

    // files/<identifier>
    [[nodiscard]] std::filesystem::path payload_path(const std::string_view identifier) const noexcept;
    // info/<identifier>.trashinfo
    [[nodiscard]] std::filesystem::path info_path(const std::string_view identifier) const noexcept;

    // Create the trash directory and subdirectories if they do not exist.
    [[nodiscard]] std::error_code create() const noexcept;

    // Create files/ and info/ if they do not exist.
    [[nodiscard]] std::error_code create_subdirs() const noexcept;

    [[nodiscard]] bool is_symlink() const noexcept;

  private:
    // Create the root at mode 700, or 1777 if 700 cannot be applied
    [[nodiscard]] std::error_code create_root() const noexcept;

    // the full path for this trash directory
    std::filesystem::path trash_path_;
    // the path of the "files" subdirectory of this trash dir
    std::filesystem::path files_path_;
    // the path of the "info" subdirectory of this trash dir
    std::filesystem::path info_path_;

    kind kind_;
    dev_t device_;
};
} // namespace trash
