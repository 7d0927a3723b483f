// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Strata - embedded SQLite access layer
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef STRATA_DATABASE_QUERY_IDENTIFIER_HPP
#define STRATA_DATABASE_QUERY_IDENTIFIER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace strata::database::query {

/**
 * @brief True if the text is non-empty and made only of ASCII letters,
 * digits, underscores and whitespace.
 */
[[nodiscard]] bool isPlainIdentifier(std::string_view text) noexcept;

/**
 * @brief Checks a table or column name before it is spliced into SQL text.
 *
 * Accepted forms:
 * - a plain identifier (see isPlainIdentifier)
 * - a plain identifier, or nothing, followed by exactly one '*' ("*")
 * - a parenthesized comma separated list of plain identifiers ("(a, b)")
 *
 * Quotes, semicolons, comment markers and any other punctuation fail, as
 * does any word the engine treats as a keyword ("id OR 1", "order").
 */
[[nodiscard]] bool isValidIdentifier(std::string_view text) noexcept;

/**
 * @brief Throws ValidationError unless isValidIdentifier(text) holds.
 *
 * @param text The identifier to check.
 * @param what Used in the message, e.g. "table name".
 */
void requireIdentifier(std::string_view text, std::string_view what);

/**
 * @brief Splits "a, b" or "(a, b)" into its trimmed plain identifiers.
 *
 * @throws ValidationError if any element is not a plain identifier or is
 * an engine keyword
 */
[[nodiscard]] std::vector<std::string> splitIdentifierList(
    std::string_view text);

}  // namespace strata::database::query

#endif  // STRATA_DATABASE_QUERY_IDENTIFIER_HPP
