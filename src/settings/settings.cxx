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

#include <filesystem>
#include <string>

#include <glaze/glaze.hpp>

#include <glibmm.h>

#include "settings/settings.hxx"

#include "logger.hxx"

std::filesystem::path
config::default_dir() noexcept
{
    return std::filesystem::path(Glib::get_user_config_dir()) / PACKAGE_NAME;
}

config::settings
config::load(const std::filesystem::path& config_dir) noexcept
{
    const auto session = config_dir / config::disk_format::filename;

    std::error_code fs_ec;
    if (!std::filesystem::exists(session, fs_ec))
    {
        logger::debug("No config file, using defaults: {}", session.string());
        return {};
    }

    config_file_data config_data;
    std::string buffer;
    const auto ec = glz::read_file_json<glz::opts{.error_on_unknown_keys = false}>(config_data,
                                                                                   session.c_str(),
                                                                                   buffer);
    if (ec)
    {
        logger::error("Failed to load config file: {}", glz::format_error(ec, buffer));
        return {};
    }

    if (config_data.version > config::disk_format::version)
    {
        logger::warn("Config file version {} is newer than supported version {}",
                     config_data.version,
                     config::disk_format::version);
    }

    return config::settings{
        .confirm_empty = config_data.confirm_empty,
        .long_format = config_data.long_format,
    };
}
