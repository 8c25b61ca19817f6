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
#include <string>

#include <doctest/doctest.h>

#include "trash/error.hxx"
#include "trash/trashinfo.hxx"

using namespace std::chrono_literals;

static std::chrono::local_seconds
make_date(int y, unsigned m, unsigned d, int hh, int mm, int ss)
{
    return std::chrono::local_days{std::chrono::year{y} / std::chrono::month{m} /
                                   std::chrono::day{d}} +
           std::chrono::hours{hh} + std::chrono::minutes{mm} + std::chrono::seconds{ss};
}

TEST_SUITE("trash::trashinfo" * doctest::description(""))
{
    TEST_CASE("trash::trashinfo::encode")
    {
        SUBCASE("plain path")
        {
            const auto text =
                trash::trashinfo::encode("/home/user/docs/report.txt", make_date(2025, 1, 31, 18, 4, 55));

            CHECK_EQ(text,
                     "[Trash Info]\n"
                     "Path=/home/user/docs/report.txt\n"
                     "DeletionDate=2025-01-31T18:04:55\n");
        }

        SUBCASE("escaped path")
        {
            const auto text =
                trash::trashinfo::encode("/home/user/report final%.txt", make_date(2004, 8, 31, 22, 32, 8));

            CHECK_EQ(text,
                     "[Trash Info]\n"
                     "Path=/home/user/report%20final%25.txt\n"
                     "DeletionDate=2004-08-31T22:32:08\n");
        }

        SUBCASE("non ascii path")
        {
            CHECK_EQ(trash::trashinfo::escape_path("/tmp/\xc3\xa9t\xc3\xa9"), "/tmp/%C3%A9t%C3%A9");
        }

        SUBCASE("member")
        {
            const trash::trashinfo info{"/a/b", make_date(2020, 2, 29, 0, 0, 0)};
            CHECK_EQ(info.encode(), "[Trash Info]\nPath=/a/b\nDeletionDate=2020-02-29T00:00:00\n");
        }
    }

    TEST_CASE("trash::trashinfo::decode")
    {
        SUBCASE("valid")
        {
            const auto info = trash::trashinfo::decode("[Trash Info]\n"
                                                       "Path=/home/user/report%20final.txt\n"
                                                       "DeletionDate=2025-01-31T18:04:55\n");
            REQUIRE(info.has_value());
            CHECK_EQ(info->path, std::filesystem::path("/home/user/report final.txt"));
            CHECK_EQ(info->deletion_date, make_date(2025, 1, 31, 18, 4, 55));
        }

        SUBCASE("round trip")
        {
            for (const std::filesystem::path path :
                 {"/", "/a b/c", "/tmp/100%", "/tmp/\xc3\xa9t\xc3\xa9/[x]#?&=;", "/home/u/.hidden",
                  "/home/user/caf\xE9.txt"})
            {
                const auto date = make_date(1999, 12, 31, 23, 59, 59);
                const auto info = trash::trashinfo::decode(trash::trashinfo::encode(path, date));
                REQUIRE(info.has_value());
                CHECK_EQ(info->path, path);
                CHECK_EQ(info->deletion_date, date);
            }
        }

        SUBCASE("path bytes that are not UTF-8")
        {
            const auto info = trash::trashinfo::decode("[Trash Info]\n"
                                                       "Path=/home/user/caf%E9.txt\n"
                                                       "DeletionDate=2021-06-01T12:00:00\n");
            REQUIRE(info.has_value());
            CHECK_EQ(info->path.native(), std::string("/home/user/caf\xE9.txt"));
        }

        SUBCASE("crlf, comments, and blank lines")
        {
            const auto info = trash::trashinfo::decode("[Trash Info]\r\n"
                                                       "# comment\r\n"
                                                       "\r\n"
                                                       "Path=/x\r\n"
                                                       "DeletionDate=2021-06-01T12:00:00\r\n");
            REQUIRE(info.has_value());
            CHECK_EQ(info->path, std::filesystem::path("/x"));
        }

        SUBCASE("first occurrence wins")
        {
            const auto info = trash::trashinfo::decode("[Trash Info]\n"
                                                       "Path=/first\n"
                                                       "Path=/second\n"
                                                       "DeletionDate=2021-06-01T12:00:00\n"
                                                       "DeletionDate=junk\n");
            REQUIRE(info.has_value());
            CHECK_EQ(info->path, std::filesystem::path("/first"));
        }

        SUBCASE("keys from other groups are ignored")
        {
            const auto info = trash::trashinfo::decode("[Trash Info]\n"
                                                       "Path=/x\n"
                                                       "[Other]\n"
                                                       "DeletionDate=2021-06-01T12:00:00\n");
            REQUIRE_FALSE(info.has_value());
            CHECK_EQ(info.error(), trash::error_code::info_missing_date);
        }

        SUBCASE("missing header")
        {
            const auto info = trash::trashinfo::decode("Path=/x\nDeletionDate=2021-06-01T12:00:00\n");
            REQUIRE_FALSE(info.has_value());
            CHECK_EQ(info.error(), trash::error_code::info_missing_header);

            for (const auto* text : {"  [Trash Info]\nPath=/x\nDeletionDate=2021-06-01T12:00:00\n",
                                     "\t[Trash Info]\nPath=/x\nDeletionDate=2021-06-01T12:00:00\n",
                                     "[Trash Info] \nPath=/x\nDeletionDate=2021-06-01T12:00:00\n"})
            {
                const auto padded = trash::trashinfo::decode(text);
                REQUIRE_FALSE(padded.has_value());
                CHECK_EQ(padded.error(), trash::error_code::info_missing_header);
            }

            const auto empty = trash::trashinfo::decode("");
            REQUIRE_FALSE(empty.has_value());
            CHECK_EQ(empty.error(), trash::error_code::info_missing_header);
        }

        SUBCASE("missing path")
        {
            const auto info = trash::trashinfo::decode("[Trash Info]\nDeletionDate=2021-06-01T12:00:00\n");
            REQUIRE_FALSE(info.has_value());
            CHECK_EQ(info.error(), trash::error_code::info_missing_path);
        }

        SUBCASE("malformed path")
        {
            for (const auto* text : {"[Trash Info]\nPath=relative/x\nDeletionDate=2021-06-01T12:00:00\n",
                                     "[Trash Info]\nPath=/bad%zzescape\nDeletionDate=2021-06-01T12:00:00\n",
                                     "[Trash Info]\nPath=\nDeletionDate=2021-06-01T12:00:00\n"})
            {
                const auto info = trash::trashinfo::decode(text);
                REQUIRE_FALSE(info.has_value());
                CHECK_EQ(info.error(), trash::error_code::info_malformed_path);
            }
        }

        SUBCASE("missing date")
        {
            const auto info = trash::trashinfo::decode("[Trash Info]\nPath=/x\n");
            REQUIRE_FALSE(info.has_value());
            CHECK_EQ(info.error(), trash::error_code::info_missing_date);
        }

        SUBCASE("malformed date")
        {
            for (const auto* date : {"yesterday", "2021-06-01", "2021-06-01T12:00:00Z",
                                     "2021-06-01T12:00:00.5", "2021-13-01T12:00:00"})
            {
                const auto info = trash::trashinfo::decode(
                    std::string("[Trash Info]\nPath=/x\nDeletionDate=") + date + "\n");
                REQUIRE_FALSE(info.has_value());
                CHECK_EQ(info.error(), trash::error_code::info_malformed_date);
            }
        }
    }

    TEST_CASE("trash::trashinfo::now")
    {
        const auto now = trash::trashinfo::now();
        const auto parsed = trash::trashinfo::parse_date(trash::trashinfo::format_date(now));
        REQUIRE(parsed.has_value());
        CHECK_EQ(*parsed, now);
    }
}
