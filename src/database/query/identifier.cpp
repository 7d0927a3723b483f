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

#include "identifier.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cctype>

#include "../core/types.hpp"

namespace strata::database::query {

namespace {

bool isIdentifierChar(unsigned char c) noexcept {
    return std::isalnum(c) != 0 || c == '_' || std::isspace(c) != 0;
}

bool allIdentifierChars(std::string_view text, bool allowComma) noexcept {
    return std::all_of(text.begin(), text.end(), [allowComma](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return isIdentifierChar(c) || (allowComma && c == ',');
    });
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

// Words are separated by whitespace or commas; '*' and parens are not
// part of any word.
bool containsKeyword(std::string_view text) noexcept {
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto c = static_cast<unsigned char>(text[pos]);
        if (std::isalnum(c) == 0 && c != '_') {
            ++pos;
            continue;
        }
        std::size_t end = pos;
        while (end < text.size() &&
               (std::isalnum(static_cast<unsigned char>(text[end])) != 0 ||
                text[end] == '_')) {
            ++end;
        }
        if (sqlite3_keyword_check(text.data() + pos,
                                  static_cast<int>(end - pos)) != 0) {
            return true;
        }
        pos = end;
    }
    return false;
}

bool hasValidShape(std::string_view text) noexcept {
    if (isPlainIdentifier(text)) {
        return true;
    }
    if (!text.empty() && text.back() == '*') {
        // "*" or "name*", never more than one star
        return allIdentifierChars(text.substr(0, text.size() - 1), false);
    }
    if (text.size() > 2 && text.front() == '(' && text.back() == ')') {
        return allIdentifierChars(text.substr(1, text.size() - 2), true);
    }
    return false;
}

}  // namespace

bool isPlainIdentifier(std::string_view text) noexcept {
    return !text.empty() && allIdentifierChars(text, false);
}

bool isValidIdentifier(std::string_view text) noexcept {
    return hasValidShape(text) && !containsKeyword(text);
}

void requireIdentifier(std::string_view text, std::string_view what) {
    if (!isValidIdentifier(text)) {
        THROW_VALIDATION_ERROR("Invalid characters in " + std::string(what) +
                               ": " + std::string(text));
    }
}

std::vector<std::string> splitIdentifierList(std::string_view text) {
    std::string_view body = trim(text);
    if (body.size() >= 2 && body.front() == '(' && body.back() == ')') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> names;
    while (true) {
        auto comma = body.find(',');
        auto item = trim(body.substr(0, comma));
        if (!isPlainIdentifier(item) || containsKeyword(item)) {
            THROW_VALIDATION_ERROR("Invalid identifier list: " +
                                   std::string(text));
        }
        names.emplace_back(item);
        if (comma == std::string_view::npos) {
            break;
        }
        body.remove_prefix(comma + 1);
    }
    return names;
}

}  // namespace strata::database::query
