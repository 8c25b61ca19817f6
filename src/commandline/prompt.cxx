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
#include <charconv>
#include <cstddef>
#include <expected>
#include <format>
#include <istream>
#include <optional>
#include <ostream>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include <ztd/ztd.hxx>

#include "commandline/prompt.hxx"

#include "logger.hxx"

bool
commandline::prompt::confirm(std::istream& in, std::ostream& out,
                             const std::string_view message) noexcept
{
    while (true)
    {
        std::print(out, "{} [Y/n]: ", message);
        out.flush();

        std::string line;
        if (!std::getline(in, line))
        {
            std::println(out);
            return false;
        }

        const auto answer = ztd::lower(ztd::strip(line));
        if (answer.empty() || answer == "y" || answer == "yes")
        {
            return true;
        }
        if (answer == "n" || answer == "no")
        {
            return false;
        }

        logger::debug<logger::domain::commandline>("Invalid answer: {}", answer);
    }
}

static std::optional<std::size_t>
parse_number(const std::string_view str) noexcept
{
    std::size_t value = 0;
    const auto* const end = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

std::expected<std::vector<std::size_t>, std::string>
commandline::prompt::parse_selection(const std::string_view input, std::size_t count) noexcept
{
    std::vector<std::size_t> selection;

    const auto add = [&selection](std::size_t index)
    {
        if (!std::ranges::contains(selection, index))
        {
            selection.push_back(index);
        }
    };

    for (const auto& token : ztd::split(ztd::replace(input, ",", " "), " "))
    {
        if (token.empty())
        {
            continue;
        }

        std::size_t first = 0;
        std::size_t last = 0;
        if (token.contains('-'))
        {
            const auto range = ztd::partition(token, "-");
            const auto start = parse_number(range[0]);
            const auto stop = parse_number(range[2]);
            if (!start || !stop || *start > *stop)
            {
                return std::unexpected(std::format("Invalid range: {}", token));
            }
            first = *start;
            last = *stop;
        }
        else
        {
            const auto number = parse_number(token);
            if (!number)
            {
                return std::unexpected(std::format("Invalid number: {}", token));
            }
            first = *number;
            last = *number;
        }

        if (first < 1 || last > count)
        {
            return std::unexpected(std::format("Out of range: {}, must be 1-{}", token, count));
        }

        for (auto n = first; n <= last; ++n)
        {
            add(n - 1);
        }
    }

    if (selection.empty())
    {
        return std::unexpected(std::string("Nothing selected"));
    }

    return selection;
}
