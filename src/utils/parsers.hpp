/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "raffle/types.hpp"

namespace raffle::util {

  /**
   * Case-insensitive comparison of two string views.
   */
  inline bool iequals(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(lhs[i]))
          != std::tolower(static_cast<unsigned char>(rhs[i]))) {
        return false;
      }
    }
    return true;
  }

  inline std::string_view trim(std::string_view input) {
    auto first = input.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos) {
      return {};
    }
    auto last = input.find_last_not_of(" \t\n\r");
    return input.substr(first, last - first + 1);
  }

  /**
   * Parses a duration such as "30s", "500ms", "2 min" or "1h".
   * A bare number is taken as seconds.
   *
   * @param input string representation of duration
   * @return duration in milliseconds if parsing succeeded, std::nullopt
   * otherwise
   */
  inline std::optional<std::chrono::milliseconds> parseDuration(
      std::string_view input) {
    input = trim(input);

    size_t i = 0;
    while (i < input.size()
           && std::isdigit(static_cast<unsigned char>(input[i]))) {
      ++i;
    }
    if (i == 0) {
      return std::nullopt;
    }
    std::string_view number_part = input.substr(0, i);
    while (i < input.size()
           && std::isspace(static_cast<unsigned char>(input[i]))) {
      ++i;
    }
    std::string_view suffix = input.substr(i);

    uint64_t number = 0;
    const auto *end = number_part.data() + number_part.size();
    auto [ptr, ec] = std::from_chars(number_part.data(), end, number);
    if (ec != std::errc()) {
      return std::nullopt;
    }

    struct Entry {
      std::string_view suffix;
      uint64_t multiplier;
    };
    // clang-format off
    static constexpr Entry suffixes[] = {
        {"", 1000},
        {"ms", 1},        {"msec", 1},      {"millis", 1},
        {"s", 1000},      {"sec", 1000},    {"secs", 1000},
        {"second", 1000}, {"seconds", 1000},
        {"m", 60'000},    {"min", 60'000},  {"mins", 60'000},
        {"minute", 60'000}, {"minutes", 60'000},
        {"h", 3'600'000}, {"hour", 3'600'000}, {"hours", 3'600'000},
        {"d", 86'400'000}, {"day", 86'400'000}, {"days", 86'400'000},
    };
    // clang-format on
    for (const auto &[table_suffix, multiplier] : suffixes) {
      if (iequals(table_suffix, suffix)) {
        if (number > UINT64_MAX / multiplier) {
          return std::nullopt;
        }
        return std::chrono::milliseconds(number * multiplier);
      }
    }
    return std::nullopt;
  }

  /**
   * Parses an amount such as "100", "2 gwei" or "0.01 ether" into the
   * smallest currency unit. Fractions are allowed as long as the result is
   * whole; "link" is an alias of "ether" (18 decimals).
   *
   * @return amount if parsing succeeded and it fits 256 bits, std::nullopt
   * otherwise
   */
  inline std::optional<Amount> parseAmount(std::string_view input) {
    input = trim(input);

    size_t i = 0;
    while (i < input.size()
           && (std::isdigit(static_cast<unsigned char>(input[i]))
               || input[i] == '.')) {
      ++i;
    }
    std::string_view number_part = input.substr(0, i);
    while (i < input.size()
           && std::isspace(static_cast<unsigned char>(input[i]))) {
      ++i;
    }
    std::string_view suffix = input.substr(i);

    auto dot = number_part.find('.');
    std::string_view whole = number_part.substr(0, dot);
    std::string_view fraction = dot == std::string_view::npos
                                  ? std::string_view{}
                                  : number_part.substr(dot + 1);
    if ((whole.empty() and fraction.empty())
        or fraction.find('.') != std::string_view::npos) {
      return std::nullopt;
    }

    struct Entry {
      std::string_view suffix;
      size_t decimals;
    };
    static constexpr Entry units[] = {
        {"", 0},
        {"wei", 0},
        {"gwei", 9},
        {"ether", 18},
        {"eth", 18},
        {"link", 18},
    };
    auto unit = std::ranges::find_if(
        units, [&](const Entry &entry) { return iequals(entry.suffix, suffix); });
    if (unit == std::end(units) or fraction.size() > unit->decimals) {
      return std::nullopt;
    }

    std::string digits{whole};
    digits.append(fraction);
    digits.append(unit->decimals - fraction.size(), '0');
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size()));
    if (digits.empty()) {
      return Amount{0};
    }
    // uint256 max has 78 decimal digits
    if (digits.size() > 78) {
      return std::nullopt;
    }
    boost::multiprecision::cpp_int value{digits};
    if (value > std::numeric_limits<Amount>::max()) {
      return std::nullopt;
    }
    return Amount{value};
  }

  /**
   * Parses a 0x-prefixed 20-byte hex address
   */
  inline std::optional<Address> parseAddress(std::string_view input) {
    input = trim(input);
    if (input.size() != 2 + 2 * Address::size()) {
      return std::nullopt;
    }
    auto res = Address::fromHexWithPrefix(input);
    if (res.has_error()) {
      return std::nullopt;
    }
    return res.value();
  }

}  // namespace raffle::util
