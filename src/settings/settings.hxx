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

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace config
{
struct settings final
{
    // ask before emptying each trash directory
    bool confirm_empty{true};
    // use the long listing by default
    bool long_format{false};
};

struct config_file_data final
{
    std::uint64_t version{0};
    bool confirm_empty{true};
    bool long_format{false};
};

namespace disk_format
{
constexpr std::uint64_t version{1};
constexpr std::string_view filename{"config.json"};
} // namespace disk_format

// $XDG_CONFIG_HOME/tt
[[nodiscard]] std::filesystem::path default_dir() noexcept;

// Load settings from 'config_dir', defaults are used for anything missing
[[nodiscard]] config::settings load(const std::filesystem::path& config_dir) noexcept;
} // namespace config
