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

#include <set>
#include <string>

#include <doctest/doctest.h>

#include <magic_enum/magic_enum.hpp>

#include "trash/error.hxx"

TEST_SUITE("trash::error_code" * doctest::description(""))
{
    TEST_CASE("trash::error_code")
    {
        SUBCASE("trash::error_code::none")
        {
            const auto ec = trash::make_error_code(trash::error_code::none);

            CHECK_EQ(ec.category().name(), std::string("trash::error_category()"));

            CHECK_EQ(bool(ec), false);
            CHECK_EQ(ec.message(), "none");
            CHECK_EQ(ec == trash::error_code::none, true);
        }

        SUBCASE("trash::error_code::cross_device")
        {
            const auto ec = trash::make_error_code(trash::error_code::cross_device);

            CHECK_EQ(ec.category().name(), std::string("trash::error_category()"));

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "trash directory is on a different filesystem");
            CHECK_EQ(ec == trash::error_code::cross_device, true);
        }

        SUBCASE("trash::error_code::destination_exists")
        {
            const std::error_code ec = trash::error_code::destination_exists;

            CHECK_EQ(bool(ec), true);
            CHECK_EQ(ec.message(), "destination already exists");
            CHECK_EQ(ec == trash::error_code::destination_exists, true);
            CHECK_EQ(ec == trash::error_code::destination_unavailable, false);
        }

        SUBCASE("distinct messages")
        {
            std::set<std::string> messages;
            for (const auto code : magic_enum::enum_values<trash::error_code>())
            {
                const auto message = trash::make_error_code(code).message();
                CHECK_NE(message, "unknown error");
                messages.insert(message);
            }
            CHECK_EQ(messages.size(), magic_enum::enum_count<trash::error_code>());
        }
    }

    TEST_CASE("trash::is_record_error")
    {
        CHECK(trash::is_record_error(trash::error_code::info_missing_header));
        CHECK(trash::is_record_error(trash::error_code::info_missing_path));
        CHECK(trash::is_record_error(trash::error_code::info_malformed_path));
        CHECK(trash::is_record_error(trash::error_code::info_missing_date));
        CHECK(trash::is_record_error(trash::error_code::info_malformed_date));

        CHECK_FALSE(trash::is_record_error(trash::error_code::info_missing));
        CHECK_FALSE(trash::is_record_error(trash::error_code::none));
        CHECK_FALSE(trash::is_record_error(std::make_error_code(std::errc::invalid_argument)));
    }
}
