// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utils.h"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

/**
 * @brief Case-insensitive string comparison (ASCII).
 */
bool iequals(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(
        lhs, rhs, [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
    });
}

/**
 * @brief Throws a std::runtime_error indicating a non-divisible division attempt.
 *
 * @param dividend The dividend that could not be evenly divided.
 * @param divisor The divisor used in the attempted division.
 *
 * @throws std::runtime_error Always.
 */
[[noreturn]] void throw_not_divisible(long long dividend, long long divisor) {
    throw std::runtime_error(fmt::format("Cannot divide {} by {}", dividend, divisor));
}
