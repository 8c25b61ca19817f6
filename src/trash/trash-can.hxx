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

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "trash/locator.hxx"
#include "trash/mount.hxx"
#include "trash/trash-dir.hxx"
#include "trash/trashinfo.hxx"
#include "trash/user.hxx"

namespace trash
{
// A file or directory that has been moved into a trash directory
struct trashed_item final
{
    std::shared_ptr<trash::trash_dir> dir;
    std::string identifier;
    std::filesystem::path original;
    std::chrono::local_seconds deletion_date;
};

// One identifier found in a trash directory, complete or orphaned
struct entry final
{
    enum class state : std::uint8_t
    {
        complete,
        missing_payload, // .trashinfo without files/<identifier>
        missing_info,    // files/<identifier> without .trashinfo
    };

    struct payload_metadata final
    {
        std::filesystem::file_type type;
        std::filesystem::perms permissions;
        std::uintmax_t size;
        std::filesystem::file_time_type mtime;
    };

    std::shared_ptr<trash::trash_dir> dir;
    std::string identifier;
    std::expected<trash::trashinfo, std::error_code> info;
    std::optional<payload_metadata> payload;
    state status;

    [[nodiscard]] std::filesystem::path payload_path() const noexcept;
    [[nodiscard]] std::filesystem::path info_path() const noexcept;
};

struct restored_item final
{
    std::filesystem::path path;
    // set if the .trashinfo could not be removed after the payload was restored
    std::error_code cleanup;
};

struct purge_report final
{
    struct purged_item final
    {
        std::shared_ptr<trash::trash_dir> dir;
        std::string identifier;
        bool invalid_record;
        bool missing_payload;
        bool missing_info;
        // first delete failure, empty on success
        std::error_code error;
    };

    std::vector<purged_item> items;

    [[nodiscard]] std::size_t failures() const noexcept;
    [[nodiscard]] bool ok() const noexcept;
};

// This class implements the XDG Trash specification:
//
// https://standards.freedesktop.org/trash-spec/trashspec-1.0.html
class trash_can
{
  public:
    trash_can() = delete;
    trash_can(const trash::user& user, const std::shared_ptr<const trash::mount_table>& table) noexcept;
    virtual ~trash_can() = default;
    trash_can(const trash_can& other) = delete;
    trash_can(trash_can&& other) = delete;
    trash_can& operator=(const trash_can& other) = delete;
    trash_can& operator=(trash_can&& other) = delete;

    /**
     * @brief trash
     *
     * - Move a file or directory into the trash directory of its filesystem.
     *   The .trashinfo file is written and flushed before the payload is moved.
     *
     * @param[in] path The file or directory to trash, symlinks are not followed
     *
     * @return The trashed item or the reason it was not trashed
     */
    [[nodiscard]] std::expected<trash::trashed_item, std::error_code>
    trash(const std::filesystem::path& path) noexcept;

    // Trash every path, one result per path in the same order
    [[nodiscard]] std::vector<std::expected<trash::trashed_item, std::error_code>>
    trash(const std::span<const std::filesystem::path> paths) noexcept;

    // Every existing trash directory
    [[nodiscard]] std::vector<std::shared_ptr<trash::trash_dir>> trash_dirs() noexcept;

    // Call 'callback' for every entry of every trash directory,
    // ordered by trash directory then identifier. Return false from 'callback' to stop.
    void list_all(const std::function<bool(const trash::entry&)>& callback) noexcept;

    // Same as list_all() for a single trash directory, returns false if stopped
    bool list(const std::shared_ptr<trash::trash_dir>& trash_dir,
              const std::function<bool(const trash::entry&)>& callback) noexcept;

    [[nodiscard]] std::vector<trash::entry> entries() noexcept;

    /**
     * @brief restore
     *
     * - Move a trashed item back to its original location and remove its .trashinfo.
     *   Nothing is ever overwritten and missing parent directories are not created.
     *
     * @param[in] trash_dir The trash directory holding the item
     * @param[in] identifier Name of the item in files/
     *
     * @return The restored path or the reason it was not restored
     */
    [[nodiscard]] std::expected<trash::restored_item, std::error_code>
    restore(const std::shared_ptr<trash::trash_dir>& trash_dir,
            const std::string_view identifier) noexcept;

    [[nodiscard]] std::expected<trash::restored_item, std::error_code>
    restore(const trash::entry& entry) noexcept;

    // Permanently delete everything in every trash directory
    [[nodiscard]] trash::purge_report purge_all() noexcept;

    // Permanently delete everything in a trash directory
    [[nodiscard]] trash::purge_report
    purge(const std::shared_ptr<trash::trash_dir>& trash_dir) noexcept;

    // Permanently delete the selected entries
    [[nodiscard]] trash::purge_report purge(const std::span<const trash::entry> entries) noexcept;

    [[nodiscard]] trash::locator& locator() noexcept;

  protected:
    // rename(2) a payload, into or out of a trash directory, never replacing the destination
    [[nodiscard]] virtual std::error_code move_payload(const std::filesystem::path& from,
                                                       const std::filesystem::path& to) noexcept;

  private:
    // true if 'path' is a trash directory or inside of one
    [[nodiscard]] bool is_trash_path(const std::filesystem::path& path,
                                     const std::shared_ptr<trash::trash_dir>& target) noexcept;

    // Reserve a unique identifier by creating its .trashinfo file
    [[nodiscard]] std::expected<std::string, std::error_code>
    create_trash_info(const std::shared_ptr<trash::trash_dir>& trash_dir,
                      const std::filesystem::path& path, bool is_directory,
                      const std::chrono::local_seconds deletion_date) const noexcept;

    [[nodiscard]] static trash::entry
    make_entry(const std::shared_ptr<trash::trash_dir>& trash_dir,
               const std::string_view identifier, bool has_info) noexcept;

    static void purge_entry(const trash::entry& entry,
                            trash::purge_report::purged_item& item) noexcept;

    trash::locator locator_;
};
} // namespace trash
