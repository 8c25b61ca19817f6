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
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <ztd/ztd.hxx>

#include "trash/utils/utils.hxx"

std::filesystem::path
trash::utils::absolute_path(const std::filesystem::path& path) noexcept
{
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        absolute = path;
    }
    absolute = absolute.lexically_normal();

    // '/a/b/' -> '/a/b'
    if (!absolute.has_filename() && absolute.has_relative_path())
    {
        absolute = absolute.parent_path();
    }

    if (!absolute.has_relative_path())
    {
        return absolute;
    }

    const auto parent = std::filesystem::weakly_canonical(absolute.parent_path(), ec);
    if (ec)
    {
        return absolute;
    }
    return parent / absolute.filename();
}

bool
trash::utils::is_within(const std::filesystem::path& path,
                        const std::filesystem::path& parent) noexcept
{
    if (parent.empty())
    {
        return false;
    }

    // ignore the empty element of a trailing slash
    auto parent_end = parent.end();
    if (!parent.has_filename() && parent.has_relative_path())
    {
        --parent_end;
    }

    const auto [parent_it, path_it] =
        std::mismatch(parent.begin(), parent_end, path.begin(), path.end());
    return parent_it == parent_end;
}

trash::utils::split_basename_extension_data
trash::utils::split_basename_extension(const std::filesystem::path& filename,
                                       bool is_directory) noexcept
{
    if (is_directory)
    {
        return {filename.string(), "", false};
    }

    // Find the last dot in the filename
    const auto dot_pos = filename.string().find_last_of('.');

    // Check if the dot is not at the beginning or end of the filename
    if (dot_pos != std::string::npos && dot_pos != 0 && dot_pos != filename.string().length() - 1)
    {
        const auto split = ztd::rpartition(filename.string(), ".");

        // Check if the extension is a compressed tar archive
        if (split[0].ends_with(".tar"))
        {
            // Find the second last dot in the filename
            const auto split_second = ztd::rpartition(split[0], ".");

            return {split_second[0], std::format(".{}.{}", split_second[2], split[2]), true};
        }
        else
        {
            // Return the basename and the extension
            return {split[0], std::format(".{}", split[2]), false};
        }
    }

    // No valid extension found, return the whole filename as the basename
    return {filename.string(), "", false};
}

std::string
trash::utils::numbered_name(const split_basename_extension_data& parts, std::uint32_t n,
                            const std::string_view tag) noexcept
{
    if (n < 2)
    {
        return std::format("{}{}", parts.basename, parts.extension);
    }
    return std::format("{}{}{}{}", parts.basename, tag, n, parts.extension);
}

std::expected<std::string, std::error_code>
trash::utils::read_file(const std::filesystem::path& path) noexcept
{
    std::ifstream file(path);
    if (!file)
    {
        const auto err = errno;
        return std::unexpected(
            std::error_code(err != 0 ? err : EIO, std::generic_category()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad())
    {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
    return buffer.str();
}

std::error_code
trash::utils::write_file_exclusive(const std::filesystem::path& path, const std::string_view data,
                                   std::filesystem::perms mode) noexcept
{
    const auto fd = ::open(path.c_str(),
                           O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                           static_cast<mode_t>(mode));
    if (fd == -1)
    {
        return {errno, std::generic_category()};
    }

    std::error_code ec;
    std::size_t written = 0;
    while (written < data.size())
    {
        const auto result = ::write(fd, data.data() + written, data.size() - written);
        if (result == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            ec = {errno, std::generic_category()};
            break;
        }
        written += static_cast<std::size_t>(result);
    }

    if (!ec && ::fsync(fd) == -1)
    {
        ec = {errno, std::generic_category()};
    }

    if (::close(fd) == -1 && !ec)
    {
        ec = {errno, std::generic_category()};
    }

    return ec;
}
