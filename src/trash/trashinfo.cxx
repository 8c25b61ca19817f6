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

#include <chrono>
#include <ctime>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <glibmm.h>

#include <ztd/ztd.hxx>

#include "trash/error.hxx"
#include "trash/trashinfo.hxx"

namespace
{
std::string_view
trim(std::string_view str) noexcept
{
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t'))
    {
        str.remove_prefix(1);
    }
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t' || str.back() == '\r'))
    {
        str.remove_suffix(1);
    }
    return str;
}

// the header line must match exactly, apart from a CRLF line ending
std::string_view
strip_cr(std::string_view str) noexcept
{
    if (str.ends_with('\r'))
    {
        str.remove_suffix(1);
    }
    return str;
}
} // namespace

std::string
trash::trashinfo::escape_path(const std::filesystem::path& path) noexcept
{
    return Glib::uri_escape_string(path.string(), "/", false);
}

std::expected<std::filesystem::path, std::error_code>
trash::trashinfo::unescape_path(const std::string_view escaped) noexcept
{
    if (escaped.empty())
    {
        return std::unexpected(trash::error_code::info_malformed_path);
    }

    // empty on a bad escape sequence or an escaped NUL
    const std::string unescaped = Glib::uri_unescape_string(std::string(escaped));
    if (unescaped.empty())
    {
        return std::unexpected(trash::error_code::info_malformed_path);
    }

    const std::filesystem::path path = unescaped;
    if (!path.is_absolute())
    {
        return std::unexpected(trash::error_code::info_malformed_path);
    }
    return path;
}

std::string
trash::trashinfo::format_date(const std::chrono::local_seconds date) noexcept
{
    return std::format("{:%Y-%m-%dT%H:%M:%S}", date);
}

std::expected<std::chrono::local_seconds, std::error_code>
trash::trashinfo::parse_date(const std::string_view date) noexcept
{
    std::istringstream stream{std::string(date)};

    std::chrono::local_seconds result;
    stream >> std::chrono::parse(std::string(date_format), result);
    if (stream.fail())
    {
        return std::unexpected(trash::error_code::info_malformed_date);
    }

    // trailing garbage, fractions and zones are not part of the format
    if (stream.peek() != std::char_traits<char>::eof())
    {
        return std::unexpected(trash::error_code::info_malformed_date);
    }

    return result;
}

std::chrono::local_seconds
trash::trashinfo::now() noexcept
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm{};
    ::localtime_r(&now, &tm);

    const auto date = std::chrono::year{tm.tm_year + 1900} /
                      std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)} /
                      std::chrono::day{static_cast<unsigned>(tm.tm_mday)};

    return std::chrono::local_days{date} + std::chrono::hours{tm.tm_hour} +
           std::chrono::minutes{tm.tm_min} + std::chrono::seconds{tm.tm_sec};
}

std::string
trash::trashinfo::encode(const std::filesystem::path& path,
                         const std::chrono::local_seconds deletion_date) noexcept
{
    return std::format("{}\n{}={}\n{}={}\n",
                       header,
                       path_key,
                       escape_path(path),
                       date_key,
                       format_date(deletion_date));
}

std::string
trash::trashinfo::encode() const noexcept
{
    return encode(this->path, this->deletion_date);
}

std::expected<trash::trashinfo, std::error_code>
trash::trashinfo::decode(const std::string_view text) noexcept
{
    const std::vector<std::string> lines = ztd::split(text, "\n");

    if (lines.empty() || strip_cr(lines.front()) != header)
    {
        return std::unexpected(trash::error_code::info_missing_header);
    }

    std::optional<std::string> path_value;
    std::optional<std::string> date_value;
    for (auto it = lines.cbegin() + 1; it != lines.cend(); ++it)
    {
        const auto line = trim(*it);
        if (line.empty() || line.starts_with('#'))
        {
            continue;
        }

        if (line.starts_with('['))
        { // keys after the next group header do not belong to this record
            break;
        }

        const auto pos = line.find('=');
        if (pos == std::string_view::npos)
        {
            continue;
        }

        const auto key = trim(line.substr(0, pos));
        const auto value = trim(line.substr(pos + 1));

        // first occurrence wins
        if (key == path_key && !path_value)
        {
            path_value = std::string(value);
        }
        else if (key == date_key && !date_value)
        {
            date_value = std::string(value);
        }
    }

    if (!path_value)
    {
        return std::unexpected(trash::error_code::info_missing_path);
    }
    const auto path = unescape_path(*path_value);
    if (!path)
    {
        return std::unexpected(path.error());
    }

    if (!date_value)
    {
        return std::unexpected(trash::error_code::info_missing_date);
    }
    const auto date = parse_date(*date_value);
    if (!date)
    {
        return std::unexpected(date.error());
    }

    return trashinfo{*path, *date};
}
