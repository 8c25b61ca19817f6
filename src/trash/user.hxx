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

#include <filesystem>

#include <sys/types.h>

namespace trash
{
// The parts of the process environment that decide where trash directories live.
// Captured once at startup and passed around, tests build their own.
struct user final
{
    std::filesystem::path home;
    // $XDG_DATA_HOME, or $HOME/.local/share
    std::filesystem::path data_home;
    uid_t uid;

    [[nodiscard]] static user capture() noexcept;

    // $XDG_DATA_HOME/Trash
    [[nodiscard]] std::filesystem::path home_trash() const noexcept;
};
} // namespace trash
