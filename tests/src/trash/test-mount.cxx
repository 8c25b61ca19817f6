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
#include <memory>

#include <doctest/doctest.h>

#include "trash/error.hxx"
#include "trash/mount.hxx"

#include "trash/trash-helper.hxx"

TEST_SUITE("trash::mount_resolver" * doctest::description(""))
{
    TEST_CASE_FIXTURE(trash_helper, "trash::mount_resolver::resolve")
    {
        const trash::mount_resolver resolver(this->table);

        SUBCASE("existing path")
        {
            const auto file = create_file(this->mnt / "dir/file.txt");

            const auto mount = resolver.resolve(file);
            REQUIRE(mount.has_value());
            CHECK_EQ(mount->device, mnt_device);
            CHECK_EQ(mount->topdir, this->mnt);
        }

        SUBCASE("path that does not exist uses its nearest ancestor")
        {
            const auto mount = resolver.resolve(this->home / "a/b/c.txt");
            REQUIRE(mount.has_value());
            CHECK_EQ(mount->device, home_device);
            CHECK_EQ(mount->topdir, this->home);
        }

        SUBCASE("longest mount on the same device wins")
        {
            const auto nested = this->mnt / "nested";
            std::filesystem::create_directories(nested);
            this->table->add(nested, 30);

            const auto mount = resolver.resolve(nested / "x");
            REQUIRE(mount.has_value());
            CHECK_EQ(mount->device, 30);
            CHECK_EQ(mount->topdir, nested);

            const auto outer = resolver.resolve(this->mnt / "x");
            REQUIRE(outer.has_value());
            CHECK_EQ(outer->topdir, this->mnt);
        }

        SUBCASE("no mount table entry walks up to the device root")
        {
            auto bare = std::make_shared<fake_mount_table>();
            const trash::mount_resolver bare_resolver(bare);

            // everything on one device, the walk ends at /
            const auto mount = bare_resolver.resolve(this->home);
            REQUIRE(mount.has_value());
            CHECK_EQ(mount->device, fake_mount_table::root_device);
            CHECK_EQ(mount->topdir, std::filesystem::path("/"));
        }

        SUBCASE("relative path")
        {
            const auto mount = resolver.resolve("relative/path/that/does/not/exist");
            CHECK(mount.has_value());
        }
    }

    TEST_CASE_FIXTURE(trash_helper, "trash::mount_resolver::device")
    {
        const trash::mount_resolver resolver(this->table);

        CHECK_EQ(resolver.device(this->home).value(), home_device);
        CHECK_EQ(resolver.device(this->home / "missing/deeper").value(), home_device);
        CHECK_EQ(resolver.device(this->mnt).value(), mnt_device);
    }

    TEST_CASE("trash::procfs_mount_table")
    {
        const trash::procfs_mount_table table;

        const auto mounts = table.mounts();
        CHECK_FALSE(mounts.empty());

        CHECK(table.device("/").has_value());

        const auto missing = table.device("/nonexistent/trash/path");
        REQUIRE_FALSE(missing.has_value());
        CHECK_EQ(missing.error(), std::errc::no_such_file_or_directory);
    }
}
