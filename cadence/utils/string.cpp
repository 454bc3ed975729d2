/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: String helpers used by the schedule parser and config layer

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <ranges>

namespace cadence::utils {

auto toLower(std::string_view str) -> std::string {
    std::string result(str);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto trim(std::string_view line, std::string_view symbols) -> std::string {
    if (line.empty()) {
        return {};
    }

    const auto isSymbol = [&symbols](char c) {
        return symbols.find(c) != std::string_view::npos;
    };

    auto start = std::ranges::find_if_not(line, isSymbol);
    if (start == line.end()) {
        return {};
    }

    auto rbegin = std::make_reverse_iterator(line.end());
    auto rend = std::make_reverse_iterator(start);
    auto last = std::find_if_not(rbegin, rend, isSymbol);

    return std::string(start, last.base());
}

auto startsWith(std::string_view str, std::string_view prefix) -> bool {
    return str.size() >= prefix.size() &&
           str.substr(0, prefix.size()) == prefix;
}

auto splitString(std::string_view str, char delimiter)
    -> std::vector<std::string> {
    if (str.empty()) {
        return {};
    }

    std::vector<std::string> tokens;
    tokens.reserve(std::ranges::count(str, delimiter) + 1);

    for (const auto& part : std::views::split(str, delimiter)) {
        tokens.emplace_back(part.begin(), part.end());
    }
    return tokens;
}

auto parseInt(std::string_view str) -> std::optional<int> {
    if (str.empty()) {
        return std::nullopt;
    }
    if (str.front() == '+') {
        str.remove_prefix(1);
        if (str.empty() || str.front() == '-') {
            return std::nullopt;
        }
    }

    int value = 0;
    const auto* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace cadence::utils
