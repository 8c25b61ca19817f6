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
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <ostream>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sys/ioctl.h>
#include <unistd.h>

#include <glibmm.h>

#include <ztd/ztd.hxx>

#include "commandline/render.hxx"

#include "trash/trash-can.hxx"

static std::size_t
display_width(const std::string_view name) noexcept
{
    const Glib::ustring str{std::string(name)};
    if (str.validate())
    {
        return str.size();
    }
    return name.size();
}

std::string
commandline::render::mode(const trash::entry::payload_metadata& metadata) noexcept
{
    using std::filesystem::file_type;
    using std::filesystem::perms;

    std::string str;
    switch (metadata.type)
    {
        case file_type::directory:
            str = "d";
            break;
        case file_type::symlink:
            str = "l";
            break;
        case file_type::block:
            str = "b";
            break;
        case file_type::character:
            str = "c";
            break;
        case file_type::fifo:
            str = "p";
            break;
        case file_type::socket:
            str = "s";
            break;
        default:
            str = "-";
            break;
    }

    const auto has = [&metadata](perms perm) { return (metadata.permissions & perm) != perms::none; };

    str += has(perms::owner_read) ? 'r' : '-';
    str += has(perms::owner_write) ? 'w' : '-';
    if (has(perms::set_uid))
    {
        str += has(perms::owner_exec) ? 's' : 'S';
    }
    else
    {
        str += has(perms::owner_exec) ? 'x' : '-';
    }

    str += has(perms::group_read) ? 'r' : '-';
    str += has(perms::group_write) ? 'w' : '-';
    if (has(perms::set_gid))
    {
        str += has(perms::group_exec) ? 's' : 'S';
    }
    else
    {
        str += has(perms::group_exec) ? 'x' : '-';
    }

    str += has(perms::others_read) ? 'r' : '-';
    str += has(perms::others_write) ? 'w' : '-';
    if (has(perms::sticky_bit))
    {
        str += has(perms::others_exec) ? 't' : 'T';
    }
    else
    {
        str += has(perms::others_exec) ? 'x' : '-';
    }

    return str;
}

std::string
commandline::render::display_name(const trash::entry& entry) noexcept
{
    switch (entry.status)
    {
        case trash::entry::state::missing_info:
            return std::format("{} (no info)", entry.identifier);
        case trash::entry::state::missing_payload:
            return std::format("{} (no file)", entry.identifier);
        case trash::entry::state::complete:
            break;
    }
    if (!entry.info)
    {
        return std::format("{} (invalid info)", entry.identifier);
    }
    return entry.identifier;
}

std::string
commandline::render::deletion_date(const trash::entry& entry) noexcept
{
    if (!entry.info)
    {
        return "????-??-?? ??:??:??";
    }
    return std::format("{:%Y-%m-%d %H:%M:%S}", entry.info->deletion_date);
}

std::string
commandline::render::long_line(const trash::entry& entry) noexcept
{
    std::string mode = "----------";
    std::string size = "-";
    if (entry.payload)
    {
        mode = commandline::render::mode(*entry.payload);
        size = ztd::format_filesize(static_cast<std::uint64_t>(entry.payload->size), ztd::base::iec);
    }

    std::string original;
    if (entry.info)
    {
        original = entry.info->path.string();
    }
    else
    {
        original = entry.info.error().message();
    }

    return std::format("{} {:>10} {} {} -> {}",
                       mode,
                       size,
                       deletion_date(entry),
                       display_name(entry),
                       original);
}

std::string
commandline::render::grid(const std::span<const std::string> names, std::size_t width) noexcept
{
    static constexpr std::size_t spacing = 2;

    if (names.empty())
    {
        return "";
    }

    std::vector<std::size_t> widths;
    widths.reserve(names.size());
    for (const auto& name : names)
    {
        widths.push_back(display_width(name));
    }

    std::size_t rows = 1;
    std::vector<std::size_t> column_widths;
    for (; rows <= names.size(); ++rows)
    {
        const auto columns = (names.size() + rows - 1) / rows;

        column_widths.assign(columns, 0);
        for (std::size_t i = 0; i < names.size(); ++i)
        {
            column_widths[i / rows] = std::max(column_widths[i / rows], widths[i]);
        }

        std::size_t total = spacing * (columns - 1);
        for (const auto column_width : column_widths)
        {
            total += column_width;
        }
        if (total <= width || columns == 1)
        {
            break;
        }
    }

    std::string out;
    for (std::size_t row = 0; row < rows; ++row)
    {
        std::string line;
        for (std::size_t column = 0; column < column_widths.size(); ++column)
        {
            const auto index = column * rows + row;
            if (index >= names.size())
            {
                break;
            }
            if (!line.empty())
            {
                line.append(spacing, ' ');
            }
            line += names[index];

            const auto next = (column + 1) * rows + row;
            if (next < names.size())
            {
                line.append(column_widths[column] - widths[index], ' ');
            }
        }
        out += line;
        out += '\n';
    }
    return out;
}

void
commandline::render::trash_dir(std::ostream& out, const trash::trash_dir& trash_dir,
                               const std::span<const trash::entry> entries, bool long_format,
                               std::size_t width) noexcept
{
    std::println(out, "{}", trash_dir.files().string());

    if (entries.empty())
    {
        std::println(out, "  (empty)");
        return;
    }

    if (long_format)
    {
        for (const auto& entry : entries)
        {
            std::println(out, "{}", long_line(entry));
        }
        return;
    }

    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& entry : entries)
    {
        names.push_back(display_name(entry));
    }
    std::print(out, "{}", grid(names, width));
}

std::size_t
commandline::render::terminal_width() noexcept
{
    struct winsize ws{};
    if (::isatty(STDOUT_FILENO) && ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    {
        return ws.ws_col;
    }
    return 80;
}
