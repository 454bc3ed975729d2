/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: String helpers used by the schedule parser and config layer

**************************************************/

#ifndef CADENCE_UTILS_STRING_HPP
#define CADENCE_UTILS_STRING_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cadence::utils {

/**
 * @brief Converts ASCII letters of the string to lowercase.
 *
 * @param str The string to convert.
 * @return Lowercase copy of the string.
 */
[[nodiscard]] auto toLower(std::string_view str) -> std::string;

/**
 * @brief Removes leading and trailing characters contained in symbols.
 *
 * @param line The string to trim.
 * @param symbols Characters to strip (whitespace by default).
 * @return The trimmed string.
 */
[[nodiscard]] auto trim(std::string_view line,
                        std::string_view symbols = " \n\r\t") -> std::string;

[[nodiscard]] auto startsWith(std::string_view str, std::string_view prefix)
    -> bool;

/**
 * @brief Splits a string on a delimiter, keeping empty fields.
 *
 * @param str The string to split.
 * @param delimiter The delimiter character.
 * @return The fields; empty input yields an empty vector.
 */
[[nodiscard]] auto splitString(std::string_view str, char delimiter)
    -> std::vector<std::string>;

/**
 * @brief Parses a base-10 integer that spans the whole string.
 *
 * An optional leading sign is accepted. Trailing characters, empty input and
 * values outside the range of int yield std::nullopt.
 */
[[nodiscard]] auto parseInt(std::string_view str) -> std::optional<int>;

}  // namespace cadence::utils

#endif  // CADENCE_UTILS_STRING_HPP
