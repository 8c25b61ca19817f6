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
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace trash
{
// The parsed form of a .trashinfo file
//
// [Trash Info]
// Path=/home/user/docs/report%20final.txt
// DeletionDate=2025-01-31T18:04:55
struct trashinfo final
{
    static constexpr std::string_view header = "[Trash Info]";
    static constexpr std::string_view path_key = "Path";
    static constexpr std::string_view date_key = "DeletionDate";
    static constexpr std::string_view extension = ".trashinfo";
    static constexpr std::string_view date_format = "%Y-%m-%dT%H:%M:%S";

    // original absolute path of the trashed item
    std::filesystem::path path;
    // local wall clock time, the file format has no zone
    std::chrono::local_seconds deletion_date;

    [[nodiscard]] static std::string encode(const std::filesystem::path& path,
                                            const std::chrono::local_seconds deletion_date) noexcept;
    [[nodiscard]] std::string encode() const noexcept;

    [[nodiscard]] static std::expected<trashinfo, std::error_code>
    decode(const std::string_view text) noexcept;

    // RFC 3986 escaping, everything but unreserved characters and '/' is escaped
    [[nodiscard]] static std::string escape_path(const std::filesystem::path& path) noexcept;
    [[nodiscard]] static std::expected<std::filesystem::path, std::error_code>
    unescape_path(const std::string_view escaped) noexcept;

    [[nodiscard]] static std::string format_date(const std::chrono::local_seconds date) noexcept;
    [[nodiscard]] static std::expected<std::chrono::local_seconds, std::error_code>
    parse_date(const std::string_view date) noexcept;

    // current local time, truncated to seconds
    [[nodiscard]] static std::chrono::local_seconds now() noexcept;

    bool operator==(const trashinfo& other) const = default;
};
} // namespace trash
