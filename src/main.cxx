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

#include <iostream>
#include <memory>

#include "commandline/actions.hxx"
#include "commandline/commandline.hxx"
#include "commandline/render.hxx"

#include "settings/settings.hxx"

#include "trash/mount.hxx"
#include "trash/trash-can.hxx"
#include "trash/user.hxx"

#include "logger.hxx"

int
main(int argc, char* argv[])
{
    const auto opts = commandline::run(argc, argv);
    if (!opts)
    {
        return opts.error();
    }

    const auto settings =
        config::load(opts->config_dir.empty() ? config::default_dir() : opts->config_dir);

    const auto user = trash::user::capture();
    logger::debug("home trash: {}", user.home_trash().string());

    trash::trash_can trash_can(user, std::make_shared<trash::procfs_mount_table>());

    const commandline::action::streams io{
        .in = std::cin,
        .out = std::cout,
        .err = std::cerr,
        .width = commandline::render::terminal_width(),
    };

    const bool long_format = opts->long_format || settings.long_format;

    if (opts->empty)
    {
        const bool confirm = !opts->no_confirm && settings.confirm_empty;
        return commandline::action::empty(trash_can, confirm, opts->display, long_format, io);
    }

    if (opts->restore)
    {
        return commandline::action::restore(trash_can, io);
    }

    if (!opts->files.empty())
    {
        const auto status = commandline::action::trash_files(trash_can, opts->files, io);
        if (opts->display)
        {
            const auto display_status = commandline::action::display(trash_can, long_format, io);
            return status != 0 ? status : display_status;
        }
        return status;
    }

    return commandline::action::display(trash_can, long_format, io);
}
