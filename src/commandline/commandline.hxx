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

#include <expected>
#include <filesystem>
#include <vector>

namespace commandline
{
struct opts final
{
    std::vector<std::filesystem::path> files;

    bool display{false};
    bool long_format{false};
    bool empty{false};
    bool no_confirm{false};
    bool restore{false};

    std::filesystem::path config_dir;
};

// Parse the command line and initialize logging.
// On failure the help or error text has already been printed and the exit status is returned.
std::expected<opts, int> run(int argc, char* argv[]) noexcept;
} // namespace commandline
