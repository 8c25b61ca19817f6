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

#include <cstddef>
#include <sstream>
#include <vector>

#include <doctest/doctest.h>

#include "commandline/prompt.hxx"

TEST_SUITE("commandline::prompt" * doctest::description(""))
{
    TEST_CASE("commandline::prompt::confirm")
    {
        std::ostringstream out;

        SUBCASE("empty answer is yes")
        {
            std::istringstream in("\n");
            CHECK(commandline::prompt::confirm(in, out, "empty?"));
            CHECK_EQ(out.str(), "empty? [Y/n]: ");
        }

        SUBCASE("yes")
        {
            std::istringstream in(" YES \n");
            CHECK(commandline::prompt::confirm(in, out, "empty?"));
        }

        SUBCASE("no")
        {
            std::istringstream in("n\n");
            CHECK_FALSE(commandline::prompt::confirm(in, out, "empty?"));
        }

        SUBCASE("invalid answers ask again")
        {
            std::istringstream in("maybe\nsure\ny\n");
            CHECK(commandline::prompt::confirm(in, out, "empty?"));
            CHECK_EQ(out.str(), "empty? [Y/n]: empty? [Y/n]: empty? [Y/n]: ");
        }

        SUBCASE("end of input is no")
        {
            std::istringstream in("");
            CHECK_FALSE(commandline::prompt::confirm(in, out, "empty?"));
        }
    }

    TEST_CASE("commandline::prompt::parse_selection")
    {
        SUBCASE("numbers")
        {
            const auto selection = commandline::prompt::parse_selection("1 3 5", 5);
            REQUIRE(selection.has_value());
            CHECK_EQ(*selection, std::vector<std::size_t>{0, 2, 4});
        }

        SUBCASE("ranges and commas")
        {
            const auto selection = commandline::prompt::parse_selection(" 2-4,1  3 ", 5);
            REQUIRE(selection.has_value());
            CHECK_EQ(*selection, std::vector<std::size_t>{1, 2, 3, 0});
        }

        SUBCASE("out of range")
        {
            CHECK_FALSE(commandline::prompt::parse_selection("0", 3).has_value());
            CHECK_FALSE(commandline::prompt::parse_selection("4", 3).has_value());
            CHECK_FALSE(commandline::prompt::parse_selection("2-4", 3).has_value());
        }

        SUBCASE("invalid")
        {
            CHECK_FALSE(commandline::prompt::parse_selection("", 3).has_value());
            CHECK_FALSE(commandline::prompt::parse_selection("a", 3).has_value());
            CHECK_FALSE(commandline::prompt::parse_selection("3-1", 3).has_value());
            CHECK_FALSE(commandline::prompt::parse_selection("1-", 3).has_value());
            CHECK_FALSE(commandline::prompt::parse_selection("-1", 3).has_value());
        }
    }
}
