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

#pragma once

#include <cstddef>
#include <expected>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace commandline::prompt
{
/**
 * @brief confirm
 *
 * - Ask a yes/no question, an empty answer means yes.
 *   Anything other than y/yes/n/no asks again.
 *
 * @param[in] in Where the answer is read from
 * @param[in] out Where the question is written to
 * @param[in] message The question, without the [Y/n] suffix
 *
 * @return true if the answer was yes, false on no or end of input
 */
[[nodiscard]] bool confirm(std::istream& in, std::ostream& out, const std::string_view message) noexcept;

// Parse a selection such as '1 3 5' or '2-4' of items numbered from 1 to 'count'.
// Returns zero based indexes in input order without duplicates.
[[nodiscard]] std::expected<std::vector<std::size_t>, std::string>
parse_selection(const std::string_view input, std::size_t count) noexcept;
} // namespace commandline::prompt
