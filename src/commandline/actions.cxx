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

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <memory>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <ztd/ztd.hxx>

#include "commandline/actions.hxx"
#include "commandline/prompt.hxx"
#include "commandline/render.hxx"

#include "trash/error.hxx"
#include "trash/trash-can.hxx"

#include "logger.hxx"

static std::vector<trash::entry>
dir_entries(trash::trash_can& trash_can, const std::shared_ptr<trash::trash_dir>& trash_dir) noexcept
{
    std::vector<trash::entry> entries;
    trash_can.list(trash_dir,
                   [&entries](const trash::entry& entry)
                   {
                       entries.push_back(entry);
                       return true;
                   });
    return entries;
}

int
commandline::action::trash_files(trash::trash_can& trash_can,
                                 const std::span<const std::filesystem::path> paths,
                                 const streams& io) noexcept
{
    const auto results = trash_can.trash(paths);

    std::vector<std::string> trashed;
    bool failed = false;
    for (std::size_t i = 0; i < results.size(); ++i)
    {
        if (results[i])
        {
            trashed.push_back(paths[i].string());
        }
        else
        {
            std::println(io.err,
                         "{}: cannot trash '{}': {}",
                         PACKAGE_NAME,
                         paths[i].string(),
                         results[i].error().message());
            failed = true;
        }
    }

    if (!trashed.empty())
    {
        std::println(io.out, "Trashed: {}", ztd::join(trashed, ", "));
    }

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

int
commandline::action::display(trash::trash_can& trash_can, bool long_format,
                             const streams& io) noexcept
{
    const auto trash_dirs = trash_can.trash_dirs();
    if (trash_dirs.empty())
    {
        std::println(io.err,
                     "{}: {}",
                     PACKAGE_NAME,
                     trash::make_error_code(trash::error_code::no_trash_directories).message());
        return EXIT_FAILURE;
    }

    for (const auto& trash_dir : trash_dirs)
    {
        const auto entries = dir_entries(trash_can, trash_dir);
        commandline::render::trash_dir(io.out, *trash_dir, entries, long_format, io.width);
    }
    return EXIT_SUCCESS;
}

int
commandline::action::empty(trash::trash_can& trash_can, bool confirm, bool display,
                           bool long_format, const streams& io) noexcept
{
    bool failed = false;
    for (const auto& trash_dir : trash_can.trash_dirs())
    {
        const auto entries = dir_entries(trash_can, trash_dir);
        if (entries.empty())
        {
            std::println(io.out, "({}): {}", entries.size(), trash_dir->root().string());
            continue;
        }

        if (display || long_format)
        {
            commandline::render::trash_dir(io.out, *trash_dir, entries, long_format, io.width);
        }

        if (confirm)
        {
            const auto message = std::format("({}): {} - to empty?",
                                             entries.size(),
                                             trash_dir->root().string());
            if (!commandline::prompt::confirm(io.in, io.out, message))
            {
                logger::info<logger::domain::commandline>("Skipped {}", trash_dir->root().string());
                continue;
            }
        }

        const auto report = trash_can.purge(trash_dir);
        for (const auto& item : report.items)
        {
            if (item.error)
            {
                std::println(io.err,
                             "{}: cannot delete '{}': {}",
                             PACKAGE_NAME,
                             item.dir->payload_path(item.identifier).string(),
                             item.error.message());
            }
            else if (item.invalid_record || item.missing_payload || item.missing_info)
            {
                const auto path = item.missing_payload ? item.dir->info_path(item.identifier)
                                                       : item.dir->payload_path(item.identifier);
                const std::string_view note = item.invalid_record    ? "invalid info"
                                              : item.missing_payload ? "no file"
                                                                     : "no info";
                std::println(io.out, "Deleted '{}' ({})", path.string(), note);
            }
        }

        if (report.ok())
        {
            std::println(io.out, "Emptied trash at: {}", trash_dir->root().string());
        }
        else
        {
            failed = true;
        }
    }

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

int
commandline::action::restore(trash::trash_can& trash_can, const streams& io) noexcept
{
    std::vector<trash::entry> restorable;
    trash_can.list_all(
        [&restorable](const trash::entry& entry)
        {
            if (entry.status == trash::entry::state::complete && entry.info)
            {
                restorable.push_back(entry);
            }
            return true;
        });

    if (restorable.empty())
    {
        std::println(io.out, "Nothing to restore");
        return EXIT_SUCCESS;
    }

    for (std::size_t i = 0; i < restorable.size(); ++i)
    {
        const auto& entry = restorable[i];
        std::println(io.out,
                     "{:>4}  {}  {} <= {}",
                     i + 1,
                     commandline::render::deletion_date(entry),
                     entry.info->path.string(),
                     entry.payload_path().string());
    }

    std::print(io.out, "Restore (e.g. 1 3 5, 2-4): ");
    io.out.flush();

    std::string line;
    if (!std::getline(io.in, line))
    {
        std::println(io.out);
        return EXIT_SUCCESS;
    }

    const auto selection = commandline::prompt::parse_selection(line, restorable.size());
    if (!selection)
    {
        std::println(io.err, "{}: {}", PACKAGE_NAME, selection.error());
        return EXIT_FAILURE;
    }

    bool failed = false;
    for (const auto index : *selection)
    {
        const auto& entry = restorable[index];
        const auto restored = trash_can.restore(entry);
        if (!restored)
        {
            std::println(io.err,
                         "{}: cannot restore '{}': {}",
                         PACKAGE_NAME,
                         entry.info->path.string(),
                         restored.error().message());
            failed = true;
            continue;
        }

        std::println(io.out, "Restored: {}", restored->path.string());
        if (restored->cleanup)
        {
            std::println(io.err,
                         "{}: '{}': {}",
                         PACKAGE_NAME,
                         entry.info_path().string(),
                         restored->cleanup.message());
        }
    }

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
