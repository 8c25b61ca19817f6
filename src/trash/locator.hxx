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

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

#include "trash/mount.hxx"
#include "trash/trash-dir.hxx"
#include "trash/user.hxx"

namespace trash
{
class locator final
{
  public:
    locator() = delete;
    locator(const trash::user& user, const std::shared_ptr<const trash::mount_table>& table) noexcept;

    /**
     * @brief locate
     *
     * - Find the trash directory that must be used for a path, without creating anything.
     *   The home trash is used for paths on the home filesystem, otherwise
     *   $topdir/.Trash/$uid if $topdir/.Trash is a valid admin trash, else $topdir/.Trash-$uid.
     *
     * @param[in] path The path that will be trashed
     *
     * @return The trash directory, trash::error_code::path_resolution or
     * trash::error_code::trash_symlink
     */
    [[nodiscard]] std::expected<std::shared_ptr<trash::trash_dir>, std::error_code>
    locate(const std::filesystem::path& path) noexcept;

    // Create the trash directory and its subdirectories if they do not exist
    [[nodiscard]] static std::error_code
    provision(const std::shared_ptr<trash::trash_dir>& trash_dir) noexcept;

    // locate() and provision()
    [[nodiscard]] std::expected<std::shared_ptr<trash::trash_dir>, std::error_code>
    resolve_for(const std::filesystem::path& path) noexcept;

    // All existing trash directories, sorted by root path
    [[nodiscard]] std::vector<std::shared_ptr<trash::trash_dir>> enumerate_known() noexcept;

    [[nodiscard]] const trash::user& user() const noexcept;
    [[nodiscard]] const trash::mount_resolver& resolver() const noexcept;

  private:
    // $topdir/.Trash must be a real directory with the sticky bit
    [[nodiscard]] static bool is_admin_trash(const std::filesystem::path& path) noexcept;

    // existing, non symlink directory
    [[nodiscard]] static bool is_usable(const std::filesystem::path& path) noexcept;

    [[nodiscard]] std::optional<dev_t> home_device() noexcept;

    trash::user user_;
    trash::mount_resolver resolver_;

    std::optional<dev_t> home_device_;
    std::unordered_map<dev_t, std::shared_ptr<trash::trash_dir>> trash_dirs_;
};
} // namespace trash
