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
#include <system_error>
#include <vector>

#include <sys/types.h>

namespace trash
{
struct mount_point final
{
    // identity of the filesystem, equal devices mean the same filesystem
    dev_t device;
    // root of the mount, $topdir
    std::filesystem::path topdir;
};

class mount_table
{
  public:
    mount_table() = default;
    virtual ~mount_table() = default;
    mount_table(const mount_table& other) = delete;
    mount_table(mount_table&& other) = delete;
    mount_table& operator=(const mount_table& other) = delete;
    mount_table& operator=(mount_table&& other) = delete;

    // Mount points of all mounted filesystems
    [[nodiscard]] virtual std::vector<std::filesystem::path> mounts() const noexcept = 0;

    // Device of an existing path, symlinks are not followed
    [[nodiscard]] virtual std::expected<dev_t, std::error_code>
    device(const std::filesystem::path& path) const noexcept = 0;
};

// mount_table backed by /proc/self/mountinfo and lstat(2)
class procfs_mount_table final : public mount_table
{
  public:
    [[nodiscard]] std::vector<std::filesystem::path> mounts() const noexcept override;
    [[nodiscard]] std::expected<dev_t, std::error_code>
    device(const std::filesystem::path& path) const noexcept override;
};

class mount_resolver final
{
  public:
    mount_resolver() = delete;
    explicit mount_resolver(const std::shared_ptr<const mount_table>& table) noexcept;

    /**
     * @brief resolve
     *
     * - Find the filesystem and mount root of a path. Paths that do not exist
     *   are resolved through their nearest existing ancestor.
     *
     * @param[in] path Absolute path, need not exist
     *
     * @return The device and $topdir of the path, or
     * trash::error_code::path_resolution if no ancestor is accessible
     */
    [[nodiscard]] std::expected<trash::mount_point, std::error_code>
    resolve(const std::filesystem::path& path) const noexcept;

    // Device of the path or its nearest existing ancestor
    [[nodiscard]] std::expected<dev_t, std::error_code>
    device(const std::filesystem::path& path) const noexcept;

    [[nodiscard]] const trash::mount_table& table() const noexcept;

  private:
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code>
    existing_ancestor(const std::filesystem::path& path) const noexcept;

    // Walk up the path until it gets to the root of the device
    [[nodiscard]] std::filesystem::path toplevel(const std::filesystem::path& path,
                                                 dev_t device) const noexcept;

    std::shared_ptr<const mount_table> table_;
};
} // namespace trash
