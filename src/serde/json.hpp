/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <qtils/byte_vec.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "raffle/raffle_state.hpp"
#include "raffle/types.hpp"

namespace raffle::json {
  enum class Error : uint8_t {
    INVALID_JSON = 1,
    NOT_OBJECT,
    MISSING_FIELD,
    WRONG_TYPE,
  };

  using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

  struct Json {
    const rapidjson::Value &v;
  };

  /// Parses a request body, which must be a JSON object
  outcome::result<rapidjson::Document> parseObject(std::string_view json_str);

  /// String member `key` of `json`, std::nullopt if absent
  outcome::result<std::optional<std::string_view>> optionalString(
      Json json, const char *key);

  inline outcome::result<std::string_view> requiredString(Json json,
                                                          const char *key) {
    OUTCOME_TRY(value, optionalString(json, key));
    if (not value.has_value()) {
      return Error::MISSING_FIELD;
    }
    return value.value();
  }

  inline void encode(Writer &writer, std::string_view v) {
    writer.String(v.data(), v.size());
  }

  inline void encode(Writer &writer, const char *v) {
    encode(writer, std::string_view{v});
  }

  inline void encode(Writer &writer, bool v) {
    writer.Bool(v);
  }

  inline void encode(Writer &writer, uint64_t v) {
    writer.Uint64(v);
  }

  inline void encode(Writer &writer, uint32_t v) {
    writer.Uint(v);
  }

  inline void encode(Writer &writer, uint16_t v) {
    writer.Uint(v);
  }

  /// Amounts overflow JSON numbers, so they are decimal strings
  inline void encode(Writer &writer, const Amount &v) {
    encode(writer, v.str());
  }

  template <size_t N>
  void encode(Writer &writer, const qtils::ByteArr<N> &v) {
    encode(writer, fmt::format("0x{}", v.toHex()));
  }

  inline void encode(Writer &writer, const qtils::ByteVec &v) {
    encode(writer, fmt::format("0x{:02x}", fmt::join(v, "")));
  }

  inline void encode(Writer &writer, RaffleState v) {
    encode(writer, toString(v));
  }

  inline void encode(Writer &writer, std::chrono::milliseconds v) {
    writer.Int64(v.count());
  }

  template <typename T>
  void encode(Writer &writer, const std::optional<T> &v) {
    if (v.has_value()) {
      encode(writer, v.value());
    } else {
      writer.Null();
    }
  }

  template <typename T>
  void field(Writer &writer, std::string_view key, const T &value) {
    writer.Key(key.data(), key.size());
    encode(writer, value);
  }

  /// Serializes whatever `f` writes into a string
  template <typename F>
  std::string write(F &&f) {
    rapidjson::StringBuffer buffer;
    Writer writer{buffer};
    std::forward<F>(f)(writer);
    return {buffer.GetString(), buffer.GetSize()};
  }
}  // namespace raffle::json

OUTCOME_HPP_DECLARE_ERROR(raffle::json, Error);
