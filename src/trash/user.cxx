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

#include <unistd.h>

#include <glibmm.h>

#include "trash/user.hxx"

trash::user
trash::user::capture() noexcept
{
    std::filesystem::path home = Glib::getenv("HOME");
    if (home.empty() || !home.is_absolute())
    {
        home = Glib::get_home_dir();
    }

    // a relative XDG_DATA_HOME is invalid and must be ignored
    std::filesystem::path data_home = Glib::getenv("XDG_DATA_HOME");
    if (data_home.empty() || !data_home.is_absolute())
    {
        data_home = home / ".local/share";
    }

    return user{
        .home = home.lexically_normal(),
        .data_home = data_home.lexically_normal(),
        .uid = geteuid(),
    };
}

std::filesystem::path
trash::user::home_trash() const noexcept
{
    return this->data_home / "Trash";
}
