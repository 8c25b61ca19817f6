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

#include <cstddef>
#include <filesystem>
#include <istream>
#include <ostream>
#include <span>

#include "trash/trash-can.hxx"

namespace commandline::action
{
struct streams final
{
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
    // terminal width for grid listings
    std::size_t width;
};

// All functions return the process exit status

// Trash every path, 'Trashed: a, b' on success, one error line per failure
[[nodiscard]] int trash_files(trash::trash_can& trash_can,
                              const std::span<const std::filesystem::path> paths,
                              const streams& io) noexcept;

// List every trash directory
[[nodiscard]] int display(trash::trash_can& trash_can, bool long_format, const streams& io) noexcept;

// Empty every trash directory, asking first for each one if 'confirm' is set
[[nodiscard]] int empty(trash::trash_can& trash_can, bool confirm, bool display, bool long_format,
                        const streams& io) noexcept;

// List the restorable entries and restore the ones selected on 'io.in'
[[nodiscard]] int restore(trash::trash_can& trash_can, const streams& io) noexcept;
} // namespace commandline::action
