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
#include <format>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <magic_enum/magic_enum.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "logger.hxx"

namespace
{
constexpr auto default_level = spdlog::level::warn;
} // namespace

void
logger::initialize() noexcept
{
    logger::initialize({}, "");
}

void
logger::initialize(const std::unordered_map<std::string, std::string>& options,
                   const std::filesystem::path& logfile) noexcept
{
    spdlog::sink_ptr file_sink = nullptr;
    if (!logfile.empty())
    {
        try
        {
            file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logfile, true);
        }
        catch (const spdlog::spdlog_ex& e)
        {
            spdlog::warn("Failed to open logfile {}: {}", logfile.string(), e.what());
        }
    }

    // listings go to stdout, keep log output on stderr
    const auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

    for (const auto d : magic_enum::enum_values<logger::domain>())
    {
        const auto name = std::string(magic_enum::enum_name(d));

        auto level = default_level;
        if (options.contains(name))
        {
            level = spdlog::level::from_str(options.at(name));
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (file_sink)
        {
            sinks.push_back(file_sink);
        }
        sinks.push_back(console_sink);

        spdlog::drop(name);

        const auto logger = std::make_shared<spdlog::logger>(name, sinks.cbegin(), sinks.cend());
        logger->set_level(level);
        logger->flush_on(level);
        if (d == logger::domain::basic)
        {
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%L%$] %v");
        }
        else
        {
            logger->set_pattern(std::format("[%Y-%m-%d %H:%M:%S.%e] [%^%L%$] [{}] %v", name));
        }
        spdlog::register_logger(logger);
    }
}
