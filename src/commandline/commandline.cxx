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

#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <print>
#include <string>
#include <unordered_map>
#include <vector>

#include <cstdlib>

#include <magic_enum/magic_enum.hpp>

#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>

#include "commandline/commandline.hxx"

#include "logger.hxx"

struct opts_data final
{
    std::vector<std::filesystem::path> files;

    bool display{false};
    bool long_format{false};
    bool empty{false};
    bool no_confirm{false};
    bool restore{false};

    std::filesystem::path config_dir;

    std::vector<std::string> raw_log_levels;
    std::unordered_map<std::string, std::string> log_levels;
    std::filesystem::path logfile;

    bool version{false};
};

static void
run_commandline(const std::shared_ptr<opts_data>& opt) noexcept
{
    if (opt->version)
    {
        std::println("{} {}", PACKAGE_NAME, PACKAGE_VERSION);
        std::exit(EXIT_SUCCESS);
    }

    logger::initialize(opt->log_levels, opt->logfile);
}

static void
setup_commandline(CLI::App& app, const std::shared_ptr<opts_data>& opt) noexcept
{
    app.add_flag("-d,--display", opt->display, "Display the trash contents");
    app.add_flag("-l,--long", opt->long_format, "Use a long listing format");
    app.add_flag("-e,--empty", opt->empty, "Empty the trash directories");
    app.add_flag("-y,--no-confirm", opt->no_confirm, "Do not ask before emptying");
    app.add_flag("-r,--restore", opt->restore, "Restore trashed files");

    app.add_option("-c,--config", opt->config_dir, "Set configuration directory")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (input.is_absolute())
                {
                    if (std::filesystem::exists(input) && !std::filesystem::is_directory(input))
                    {
                        return std::format("Config path must be a directory: {}", input.string());
                    }

                    // Validate pass
                    return std::string();
                }
                return std::format("Config path must be absolute: {}", input.string());
            });

    app.add_option("--loglevel", opt->raw_log_levels, "Set the loglevel. Format: domain=level")
        ->check(
            [&opt](const std::string& value)
            {
                constexpr auto log_levels = magic_enum::enum_names<spdlog::level::level_enum>();
                constexpr auto valid_domains = magic_enum::enum_names<logger::domain>();

                const auto pos = value.find('=');
                if (pos == std::string::npos)
                {
                    return std::string("Must be in format domain=level");
                }

                const auto domain = value.substr(0, pos);
                if (!std::ranges::contains(valid_domains, domain))
                {
                    return std::format("Invalid domain: {}", domain);
                }

                const auto level = value.substr(pos + 1);
                if (!std::ranges::contains(log_levels, level))
                {
                    return std::format("Invalid log level: {}", level);
                }

                opt->log_levels.insert({domain, level});

                return std::string();
            });

    app.add_option("--logfile", opt->logfile, "absolute path to the logfile")
        ->expected(1)
        ->check(
            [](const std::filesystem::path& input)
            {
                if (input.is_absolute())
                {
                    return std::string();
                }
                return std::format("Logfile path must be absolute: {}", input.string());
            });

    app.add_flag("-v,--version", opt->version, "Show version information");

    // Everything else
    app.add_option("files", opt->files, "[FILE]...")->expected(0, -1);

    app.callback([opt]() { run_commandline(opt); });
}

std::expected<commandline::opts, int>
commandline::run(int argc, char* argv[]) noexcept
{
    CLI::App app{PACKAGE_NAME, "Move files to the trash, list, restore and empty it"};

    auto opt = std::make_shared<opts_data>();
    setup_commandline(app, opt);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return std::unexpected{app.exit(e)};
    }

    return commandline::opts{.files = opt->files,
                             .display = opt->display,
                             .long_format = opt->long_format,
                             .empty = opt->empty,
                             .no_confirm = opt->no_confirm,
                             .restore = opt->restore,
                             .config_dir = opt->config_dir};
}
