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
#include <filesystem>
#include <memory>
#include <span>
#include <system_error>
#include <vector>

#include "logger.hxx"

#include "trash/error.hxx"
#include "trash/trash-can.hxx"

std::size_t
trash::purge_report::failures() const noexcept
{
    return static_cast<std::size_t>(
        std::ranges::count_if(this->items, [](const auto& item) { return bool(item.error); }));
}

bool
trash::purge_report::ok() const noexcept
{
    return this->failures() == 0;
}

void
trash::trash_can::purge_entry(const trash::entry& entry,
                              trash::purge_report::purged_item& item) noexcept
{
    item.dir = entry.dir;
    item.identifier = entry.identifier;
    item.invalid_record = !entry.info && (trash::is_record_error(entry.info.error()) ||
                                          entry.info.error() == trash::error_code::info_read_failed);
    item.missing_payload = entry.status == trash::entry::state::missing_payload;
    item.missing_info = entry.status == trash::entry::state::missing_info;
    item.error = {};

    std::error_code ec;
    if (entry.status != trash::entry::state::missing_payload)
    {
        std::filesystem::remove_all(entry.payload_path(), ec);
        if (ec)
        {
            logger::error<logger::domain::trash>("Failed to delete {}: {}",
                                                 entry.payload_path().string(),
                                                 ec.message());
            item.error = trash::error_code::payload_delete_failed;
        }
    }

    if (entry.status != trash::entry::state::missing_info)
    {
        std::filesystem::remove(entry.info_path(), ec);
        if (ec)
        {
            logger::error<logger::domain::trash>("Failed to delete {}: {}",
                                                 entry.info_path().string(),
                                                 ec.message());
            if (!item.error)
            {
                item.error = trash::error_code::info_delete_failed;
            }
        }
    }
}

trash::purge_report
trash::trash_can::purge(const std::span<const trash::entry> entries) noexcept
{
    trash::purge_report report;
    report.items.reserve(entries.size());

    std::vector<std::shared_ptr<trash::trash_dir>> purged_dirs;
    for (const auto& entry : entries)
    {
        auto& item = report.items.emplace_back();
        purge_entry(entry, item);

        if (std::ranges::find(purged_dirs, entry.dir) == purged_dirs.cend())
        {
            purged_dirs.push_back(entry.dir);
        }
    }

    for (const auto& trash_dir : purged_dirs)
    {
        const auto ec = trash_dir->create_subdirs();
        if (ec)
        {
            logger::warn<logger::domain::trash>("Failed to recreate {}: {}",
                                                trash_dir->root().string(),
                                                ec.message());
        }
    }

    logger::info<logger::domain::trash>("Purged {} items, {} failed",
                                        report.items.size(),
                                        report.failures());

    return report;
}

trash::purge_report
trash::trash_can::purge(const std::shared_ptr<trash::trash_dir>& trash_dir) noexcept
{
    std::vector<trash::entry> entries;
    this->list(trash_dir,
               [&entries](const trash::entry& entry)
               {
                   entries.push_back(entry);
                   return true;
               });
    if (entries.empty())
    {
        const auto ec = trash_dir->create_subdirs();
        if (ec)
        {
            logger::warn<logger::domain::trash>("Failed to recreate {}: {}",
                                                trash_dir->root().string(),
                                                ec.message());
        }
    }
    return this->purge(entries);
}

trash::purge_report
trash::trash_can::purge_all() noexcept
{
    return this->purge(this->entries());
}
