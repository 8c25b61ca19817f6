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
#include <charconv>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <glibmm.h>

#include <ztd/ztd.hxx>

#include "logger.hxx"

#include "trash/linux/procfs.hxx"

namespace
{
template<typename T>
bool
to_number(const std::string_view str, T& value) noexcept
{
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    return ec == std::errc() && ptr == str.data() + str.size();
}
} // namespace

std::vector<trash::linux::procfs::mountinfo_entry>
trash::linux::procfs::mountinfo(std::istream& stream) noexcept
{
    std::vector<mountinfo_entry> mounts;

    std::string line;
    while (std::getline(stream, line))
    {
        if (line.empty())
        {
            continue;
        }

        const std::vector<std::string> fields = ztd::split(line, " ");

        // 6 fixed fields, zero or more optional fields, the separator, then 3 more fields
        const auto separator = std::ranges::find(fields, "-");
        if (fields.size() < 10 || separator == fields.cend() ||
            std::distance(separator, fields.cend()) != 4 ||
            std::distance(fields.cbegin(), separator) < 6)
        {
            logger::error<logger::domain::mount>("Invalid mountinfo entry: size={}, line={}",
                                                 fields.size(),
                                                 line);
            continue;
        }

        mountinfo_entry mount;

        const auto minor_major = ztd::partition(fields[2], ":");
        if (!to_number(fields[0], mount.mount_id) || !to_number(fields[1], mount.parent_id) ||
            !to_number(minor_major[0], mount.major) || !to_number(minor_major[2], mount.minor))
        {
            logger::error<logger::domain::mount>("Invalid mountinfo entry: line={}", line);
            continue;
        }

        mount.root = Glib::strcompress(fields[3]);        // Encoded Field
        mount.mount_point = Glib::strcompress(fields[4]); // Encoded Field
        mount.mount_options = fields[5];
        for (auto it = fields.cbegin() + 6; it != separator; ++it)
        {
            if (!mount.optional_fields.empty())
            {
                mount.optional_fields.append(" ");
            }
            mount.optional_fields.append(*it);
        }
        mount.filesystem_type = *(separator + 1);
        mount.mount_source = Glib::strcompress(*(separator + 2));
        mount.super_options = *(separator + 3);

        // logger::trace<logger::domain::mount>("mount.mount_point = {}", mount.mount_point.string());

        mounts.push_back(mount);
    }
    return mounts;
}

std::vector<trash::linux::procfs::mountinfo_entry>
trash::linux::procfs::mountinfo() noexcept
{
    std::ifstream file(MOUNTINFO.data());
    if (!file)
    {
        logger::error<logger::domain::mount>("Failed to open the file: {}", MOUNTINFO);
        return {};
    }
    return mountinfo(file);
}
