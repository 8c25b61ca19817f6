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

#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <doctest/doctest.h>

#include "commandline/render.hxx"

#include "trash/error.hxx"
#include "trash/trash-can.hxx"

TEST_SUITE("commandline::render" * doctest::description(""))
{
    TEST_CASE("commandline::render::mode")
    {
        using std::filesystem::file_type;
        using std::filesystem::perms;

        const trash::entry::payload_metadata dir{file_type::directory,
                                                 perms::owner_all | perms::group_read |
                                                     perms::group_exec | perms::others_read |
                                                     perms::others_exec,
                                                 0,
                                                 {}};
        CHECK_EQ(commandline::render::mode(dir), "drwxr-xr-x");

        const trash::entry::payload_metadata file{file_type::regular,
                                                  perms::owner_read | perms::owner_write,
                                                  0,
                                                  {}};
        CHECK_EQ(commandline::render::mode(file), "-rw-------");

        const trash::entry::payload_metadata sticky{file_type::directory,
                                                    perms::all | perms::sticky_bit,
                                                    0,
                                                    {}};
        CHECK_EQ(commandline::render::mode(sticky), "drwxrwxrwt");

        const trash::entry::payload_metadata link{file_type::symlink, perms::all, 0, {}};
        CHECK_EQ(commandline::render::mode(link), "lrwxrwxrwx");
    }

    TEST_CASE("commandline::render::grid")
    {
        const std::vector<std::string> names{"a", "bb", "ccc", "dddd", "e"};

        SUBCASE("single row")
        {
            CHECK_EQ(commandline::render::grid(names, 80), "a  bb  ccc  dddd  e\n");
        }

        SUBCASE("columns top to bottom")
        {
            // two rows: [a bb] [ccc dddd] [e]
            CHECK_EQ(commandline::render::grid(names, 14), "a   ccc   e\nbb  dddd\n");
        }

        SUBCASE("one column when nothing fits")
        {
            CHECK_EQ(commandline::render::grid(names, 1), "a\nbb\nccc\ndddd\ne\n");
        }

        SUBCASE("empty")
        {
            CHECK_EQ(commandline::render::grid({}, 80), "");
        }
    }

    TEST_CASE("commandline::render entries")
    {
        trash::entry entry;
        entry.identifier = "x.txt";
        entry.info = trash::trashinfo{
            "/home/user/x.txt",
            std::chrono::local_days{std::chrono::year{2025} / 1 / 31} + std::chrono::hours{18} +
                std::chrono::minutes{4} + std::chrono::seconds{55}};
        entry.payload = trash::entry::payload_metadata{std::filesystem::file_type::regular,
                                                       std::filesystem::perms::owner_read |
                                                           std::filesystem::perms::owner_write,
                                                       2048,
                                                       {}};
        entry.status = trash::entry::state::complete;

        SUBCASE("complete")
        {
            CHECK_EQ(commandline::render::display_name(entry), "x.txt");
            CHECK_EQ(commandline::render::deletion_date(entry), "2025-01-31 18:04:55");

            const auto line = commandline::render::long_line(entry);
            CHECK(line.starts_with("-rw------- "));
            CHECK(line.contains("2025-01-31 18:04:55 x.txt -> /home/user/x.txt"));
        }

        SUBCASE("orphans")
        {
            entry.status = trash::entry::state::missing_payload;
            entry.payload.reset();
            CHECK_EQ(commandline::render::display_name(entry), "x.txt (no file)");
            CHECK(commandline::render::long_line(entry).starts_with("---------- "));

            entry.status = trash::entry::state::missing_info;
            CHECK_EQ(commandline::render::display_name(entry), "x.txt (no info)");
        }

        SUBCASE("invalid record")
        {
            entry.info = std::unexpected(trash::make_error_code(trash::error_code::info_missing_date));
            CHECK_EQ(commandline::render::display_name(entry), "x.txt (invalid info)");
            CHECK_EQ(commandline::render::deletion_date(entry), "????-??-?? ??:??:??");
            CHECK(commandline::render::long_line(entry).ends_with(
                "-> trash info file has no DeletionDate key"));
        }
    }
}
