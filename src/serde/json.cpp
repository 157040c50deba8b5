/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/json.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(raffle::json, Error, e) {
  using E = raffle::json::Error;
  switch (e) {
    case E::INVALID_JSON:
      return "Malformed JSON";
    case E::NOT_OBJECT:
      return "JSON object expected";
    case E::MISSING_FIELD:
      return "Required field is missing";
    case E::WRONG_TYPE:
      return "Field has wrong type";
  }
  return "Unknown json::Error";
}

namespace raffle::json {

  outcome::result<rapidjson::Document> parseObject(std::string_view json_str) {
    rapidjson::Document document;
    document.Parse(json_str.data(), json_str.size());
    if (document.HasParseError()) {
      return Error::INVALID_JSON;
    }
    if (not document.IsObject()) {
      return Error::NOT_OBJECT;
    }
    return document;
  }

  outcome::result<std::optional<std::string_view>> optionalString(
      Json json, const char *key) {
    if (not json.v.IsObject()) {
      return Error::NOT_OBJECT;
    }
    auto it = json.v.FindMember(key);
    if (it == json.v.MemberEnd() or it->value.IsNull()) {
      return std::nullopt;
    }
    if (not it->value.IsString()) {
      return Error::WRONG_TYPE;
    }
    return std::string_view{it->value.GetString(),
                            it->value.GetStringLength()};
  }

}  // namespace raffle::json
