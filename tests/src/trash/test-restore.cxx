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
#include <system_error>

#include <doctest/doctest.h>

#include "trash/error.hxx"
#include "trash/trash-can.hxx"

#include "trash/trash-helper.hxx"

TEST_SUITE("trash::trash_can::restore" * doctest::description(""))
{
    TEST_CASE_FIXTURE(trash_helper, "restore to the original path")
    {
        const auto file = create_file(this->home / "docs/report.txt", "report\n");
        const auto item = this->can->trash(file);
        REQUIRE(item.has_value());

        const auto restored = this->can->restore(item->dir, item->identifier);
        REQUIRE(restored.has_value());
        CHECK_EQ(restored->path, file);
        CHECK_FALSE(restored->cleanup);

        CHECK_EQ(read(file), "report\n");
        CHECK_EQ(count(this->home_trash() / "files"), 0);
        CHECK_EQ(count(this->home_trash() / "info"), 0);
    }

    TEST_CASE_FIXTURE(trash_helper, "restore a directory from another filesystem")
    {
        const auto dir = this->mnt / "album";
        create_file(dir / "track.flac");
        const auto item = this->can->trash(dir);
        REQUIRE(item.has_value());

        const auto entries = this->can->entries();
        REQUIRE_EQ(entries.size(), 1);

        const auto restored = this->can->restore(entries.front());
        REQUIRE(restored.has_value());
        CHECK(std::filesystem::exists(dir / "track.flac"));
    }

    TEST_CASE_FIXTURE(trash_helper, "destination exists")
    {
        const auto file = create_file(this->home / "x.txt", "old\n");
        const auto item = this->can->trash(file);
        REQUIRE(item.has_value());

        create_file(file, "new\n");

        const auto restored = this->can->restore(item->dir, item->identifier);
        REQUIRE_FALSE(restored.has_value());
        CHECK_EQ(restored.error(), trash::error_code::destination_exists);

        // nothing changed
        CHECK_EQ(read(file), "new\n");
        CHECK_EQ(read(item->dir->payload_path(item->identifier)), "old\n");
        CHECK(std::filesystem::exists(item->dir->info_path(item->identifier)));

        // still restorable once the path is free
        std::filesystem::remove(file);
        CHECK(this->can->restore(item->dir, item->identifier).has_value());
        CHECK_EQ(read(file), "old\n");
    }

    TEST_CASE_FIXTURE(trash_helper, "destination created while restoring")
    {
        const auto file = create_file(this->home / "x.txt", "trashed\n");
        const auto item = this->can->trash(file);
        REQUIRE(item.has_value());

        hooked_trash_can can(this->user, this->table);
        can.before_move = [](const std::filesystem::path& from, const std::filesystem::path& to)
        {
            (void)from;
            create_file(to, "user\n");
            return std::error_code{};
        };

        const auto restored = can.restore(item->dir, item->identifier);
        REQUIRE_FALSE(restored.has_value());
        CHECK_EQ(restored.error(), trash::error_code::destination_exists);

        CHECK_EQ(read(file), "user\n");
        CHECK_EQ(read(item->dir->payload_path(item->identifier)), "trashed\n");
        CHECK(std::filesystem::exists(item->dir->info_path(item->identifier)));
    }

    TEST_CASE_FIXTURE(trash_helper, "destination is a broken symlink")
    {
        const auto file = create_file(this->home / "x.txt");
        const auto item = this->can->trash(file);
        REQUIRE(item.has_value());

        std::filesystem::create_symlink(this->home / "nowhere", file);

        const auto restored = this->can->restore(item->dir, item->identifier);
        REQUIRE_FALSE(restored.has_value());
        CHECK_EQ(restored.error(), trash::error_code::destination_exists);
        CHECK(std::filesystem::is_symlink(file));
    }

    TEST_CASE_FIXTURE(trash_helper, "parent directory is gone")
    {
        const auto file = create_file(this->home / "gone/x.txt");
        const auto item = this->can->trash(file);
        REQUIRE(item.has_value());

        std::filesystem::remove(this->home / "gone");

        const auto restored = this->can->restore(item->dir, item->identifier);
        REQUIRE_FALSE(restored.has_value());
        CHECK_EQ(restored.error(), trash::error_code::destination_unavailable);
        CHECK_FALSE(std::filesystem::exists(this->home / "gone"));
        CHECK(std::filesystem::exists(item->dir->payload_path(item->identifier)));
    }

    TEST_CASE_FIXTURE(trash_helper, "parent is a file")
    {
        const auto file = create_file(this->home / "parent/x.txt");
        const auto item = this->can->trash(file);
        REQUIRE(item.has_value());

        std::filesystem::remove(this->home / "parent");
        create_file(this->home / "parent");

        const auto restored = this->can->restore(item->dir, item->identifier);
        REQUIRE_FALSE(restored.has_value());
        CHECK_EQ(restored.error(), trash::error_code::destination_unavailable);
    }

    TEST_CASE_FIXTURE(trash_helper, "missing info")
    {
        create_file(this->home_trash() / "files/lonely.txt");
        std::filesystem::create_directories(this->home_trash() / "info");

        const auto entries = this->can->entries();
        REQUIRE_EQ(entries.size(), 1);

        const auto restored = this->can->restore(entries.front());
        REQUIRE_FALSE(restored.has_value());
        CHECK_EQ(restored.error(), trash::error_code::info_missing);
        CHECK(std::filesystem::exists(this->home_trash() / "files/lonely.txt"));
    }

    TEST_CASE_FIXTURE(trash_helper, "missing payload")
    {
        const auto item = this->can->trash(create_file(this->home / "x.txt"));
        REQUIRE(item.has_value());
        std::filesystem::remove(item->dir->payload_path(item->identifier));

        const auto restored = this->can->restore(item->dir, item->identifier);
        REQUIRE_FALSE(restored.has_value());
        CHECK_EQ(restored.error(), trash::error_code::payload_missing);
        CHECK(std::filesystem::exists(item->dir->info_path(item->identifier)));
    }

    TEST_CASE_FIXTURE(trash_helper, "corrupt record")
    {
        const auto item = this->can->trash(create_file(this->home / "x.txt"));
        REQUIRE(item.has_value());
        create_file(item->dir->info_path(item->identifier), "[Trash Info]\nPath=/x\n");

        const auto restored = this->can->restore(item->dir, item->identifier);
        REQUIRE_FALSE(restored.has_value());
        CHECK_EQ(restored.error(), trash::error_code::corrupt_record);
        CHECK(std::filesystem::exists(item->dir->payload_path(item->identifier)));
    }

    TEST_CASE_FIXTURE(trash_helper, "restored even if the record cannot be removed")
    {
        const auto file = create_file(this->home / "x.txt", "x\n");
        const auto item = this->can->trash(file);
        REQUIRE(item.has_value());

        hooked_trash_can can(this->user, this->table);
        can.after_move = [](const std::filesystem::path& from, const std::filesystem::path& to)
        {
            (void)to;
            hooked_trash_can::block_removal(hooked_trash_can::info_of(from));
        };

        const auto restored = can.restore(item->dir, item->identifier);
        REQUIRE(restored.has_value());
        CHECK_EQ(restored->path, file);
        CHECK_EQ(restored->cleanup, trash::error_code::info_cleanup_failed);

        CHECK_EQ(read(file), "x\n");
        CHECK_FALSE(std::filesystem::exists(item->dir->payload_path(item->identifier)));
    }

    TEST_CASE_FIXTURE(trash_helper, "name that is not valid UTF-8")
    {
        const auto file = create_file(this->home / "caf\xE9.txt", "latin1\n");
        const auto item = this->can->trash(file);
        REQUIRE(item.has_value());
        CHECK_EQ(item->identifier, "caf\xE9.txt");

        const auto entries = this->can->entries();
        REQUIRE_EQ(entries.size(), 1);
        CHECK_EQ(entries[0].status, trash::entry::state::complete);
        REQUIRE(entries[0].info.has_value());
        CHECK_EQ(entries[0].info->path, file);

        const auto restored = this->can->restore(item->dir, item->identifier);
        REQUIRE(restored.has_value());
        CHECK_EQ(restored->path, file);
        CHECK_EQ(read(file), "latin1\n");
    }
}
