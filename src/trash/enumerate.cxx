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
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "logger.hxx"

#include "trash/error.hxx"
#include "trash/trash-can.hxx"
#include "trash/trashinfo.hxx"
#include "trash/utils/utils.hxx"

std::filesystem::path
trash::entry::payload_path() const noexcept
{
    return this->dir->payload_path(this->identifier);
}

std::filesystem::path
trash::entry::info_path() const noexcept
{
    return this->dir->info_path(this->identifier);
}

trash::entry
trash::trash_can::make_entry(const std::shared_ptr<trash::trash_dir>& trash_dir,
                             const std::string_view identifier, bool has_info) noexcept
{
    trash::entry entry;
    entry.dir = trash_dir;
    entry.identifier = identifier;

    if (has_info)
    {
        const auto text = trash::utils::read_file(entry.info_path());
        if (text)
        {
            entry.info = trash::trashinfo::decode(*text);
            if (!entry.info)
            {
                logger::debug<logger::domain::trash>("Invalid {}: {}",
                                                     entry.info_path().string(),
                                                     entry.info.error().message());
            }
        }
        else
        {
            logger::warn<logger::domain::trash>("Failed to read {}: {}",
                                                entry.info_path().string(),
                                                text.error().message());
            entry.info = std::unexpected(trash::error_code::info_read_failed);
        }
    }
    else
    {
        entry.info = std::unexpected(trash::error_code::info_missing);
    }

    std::error_code ec;
    const auto payload = entry.payload_path();
    const auto status = std::filesystem::symlink_status(payload, ec);
    if (std::filesystem::exists(status))
    {
        trash::entry::payload_metadata metadata{
            .type = status.type(),
            .permissions = status.permissions(),
            .size = 0,
            .mtime = {},
        };
        if (std::filesystem::is_regular_file(status))
        {
            const auto size = std::filesystem::file_size(payload, ec);
            metadata.size = ec ? 0 : size;
        }
        const auto mtime = std::filesystem::last_write_time(payload, ec);
        if (!ec)
        {
            metadata.mtime = mtime;
        }
        entry.payload = metadata;
    }

    if (!has_info)
    {
        entry.status = trash::entry::state::missing_info;
    }
    else if (!entry.payload)
    {
        entry.status = trash::entry::state::missing_payload;
    }
    else
    {
        entry.status = trash::entry::state::complete;
    }

    return entry;
}

bool
trash::trash_can::list(const std::shared_ptr<trash::trash_dir>& trash_dir,
                       const std::function<bool(const trash::entry&)>& callback) noexcept
{
    std::set<std::string> with_info;
    std::set<std::string> without_info;

    std::error_code ec;
    for (const auto& dirent : std::filesystem::directory_iterator(trash_dir->info(), ec))
    {
        const auto filename = dirent.path().filename().string();
        if (!filename.ends_with(trash::trashinfo::extension) ||
            filename.size() == trash::trashinfo::extension.size())
        {
            continue;
        }
        with_info.insert(filename.substr(0, filename.size() - trash::trashinfo::extension.size()));
    }
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        logger::warn<logger::domain::trash>("Failed to read {}: {}",
                                            trash_dir->info().string(),
                                            ec.message());
    }

    ec.clear();
    for (const auto& dirent : std::filesystem::directory_iterator(trash_dir->files(), ec))
    {
        const auto filename = dirent.path().filename().string();
        if (!with_info.contains(filename))
        {
            without_info.insert(filename);
        }
    }
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        logger::warn<logger::domain::trash>("Failed to read {}: {}",
                                            trash_dir->files().string(),
                                            ec.message());
    }

    std::vector<std::pair<std::string_view, bool>> identifiers;
    identifiers.reserve(with_info.size() + without_info.size());
    for (const auto& identifier : with_info)
    {
        identifiers.emplace_back(identifier, true);
    }
    for (const auto& identifier : without_info)
    {
        identifiers.emplace_back(identifier, false);
    }
    std::ranges::sort(identifiers, {}, &std::pair<std::string_view, bool>::first);

    for (const auto& [identifier, has_info] : identifiers)
    {
        if (!callback(make_entry(trash_dir, identifier, has_info)))
        {
            return false;
        }
    }
    return true;
}

void
trash::trash_can::list_all(const std::function<bool(const trash::entry&)>& callback) noexcept
{
    for (const auto& trash_dir : this->trash_dirs())
    {
        if (!this->list(trash_dir, callback))
        {
            return;
        }
    }
}

std::vector<trash::entry>
trash::trash_can::entries() noexcept
{
    std::vector<trash::entry> entries;
    this->list_all(
        [&entries](const trash::entry& entry)
        {
            entries.push_back(entry);
            return true;
        });
    return entries;
}
