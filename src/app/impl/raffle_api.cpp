/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/raffle_api.hpp"

#include <charconv>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <qtils/unhex.hpp>
#include <qtils/visit_in_place.hpp>

#include "app/configuration.hpp"
#include "metrics/handler.hpp"
#include "payment/payment_rail.hpp"
#include "raffle/event_log.hpp"
#include "raffle/raffle_ledger.hpp"
#include "raffle/upkeep_coordinator.hpp"
#include "serde/json.hpp"
#include "utils/parsers.hpp"

namespace raffle::app {
  namespace {
    namespace bhttp = boost::beast::http;
    using bhttp::status;

    http::Response jsonResponse(status code, std::string body) {
      http::Response response{code, 11};
      response.set(bhttp::field::content_type, "application/json");
      response.body() = std::move(body);
      return response;
    }

    http::Response errorResponse(status code, std::string_view message) {
      auto body = json::write([&](json::Writer &writer) {
        writer.StartObject();
        json::field(writer, "error", message);
        writer.EndObject();
      });
      return jsonResponse(code, std::move(body));
    }

    status statusOf(const std::error_code &ec) {
      if (ec == make_error_code(RaffleError::INSUFFICIENT_STAKE)) {
        return status::bad_request;
      }
      if (ec == make_error_code(RaffleError::NOT_OPEN)
          or ec == make_error_code(RaffleError::TRIGGER_NOT_SATISFIED)) {
        return status::conflict;
      }
      if (ec == make_error_code(RaffleError::INDEX_OUT_OF_RANGE)) {
        return status::not_found;
      }
      if (ec == make_error_code(RaffleError::BALANCE_OVERFLOW)) {
        return status::unprocessable_entity;
      }
      return status::bad_gateway;
    }

    template <typename T>
    std::optional<T> parseNumber(std::string_view input) {
      T value{};
      const auto *end = input.data() + input.size();
      auto [ptr, ec] = std::from_chars(input.data(), end, value);
      if (ec != std::errc() or ptr != end) {
        return std::nullopt;
      }
      return value;
    }

    /// Value of `key` in a `a=1&b=2` query
    std::optional<std::string_view> queryParam(std::string_view query,
                                               std::string_view key) {
      while (not query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{}
                                              : query.substr(amp + 1);
        auto eq = pair.find('=');
        if (pair.substr(0, eq) == key) {
          return eq == std::string_view::npos ? std::string_view{}
                                              : pair.substr(eq + 1);
        }
      }
      return std::nullopt;
    }

    void encodeConditions(json::Writer &writer,
                          const TriggerConditions &conditions) {
      writer.StartObject();
      json::field(writer, "isOpen", conditions.is_open);
      json::field(writer, "timePassed", conditions.time_passed);
      json::field(writer, "hasEntrants", conditions.has_entrants);
      json::field(writer, "hasBalance", conditions.has_balance);
      writer.EndObject();
    }

    void encodeSnapshot(json::Writer &writer,
                        const TriggerNotSatisfied &snapshot) {
      json::field(writer, "balance", snapshot.balance);
      json::field(writer, "entrants", snapshot.entrant_count);
      json::field(writer, "state", snapshot.state);
    }

    void encodeRecord(json::Writer &writer, const EventRecord &record) {
      writer.StartObject();
      json::field(writer, "sequence", record.sequence);
      json::field(writer, "timestamp", record.timestamp);
      json::field(writer, "type", eventName(record.event));
      qtils::visit_in_place(
          record.event,
          [&](const EnteredEvent &event) {
            json::field(writer, "participant", event.participant);
          },
          [&](const DrawRequestedEvent &event) {
            json::field(writer, "requestId", event.request_id);
          },
          [&](const WinnerPickedEvent &event) {
            json::field(writer, "winner", event.winner);
          });
      writer.EndObject();
    }
  }  // namespace

  RaffleApi::RaffleApi(qtils::SharedRef<log::LoggingSystem> logsys,
                       qtils::SharedRef<Configuration> app_config,
                       qtils::SharedRef<RaffleLedger> ledger,
                       qtils::SharedRef<UpkeepCoordinator> coordinator,
                       qtils::SharedRef<EventLog> event_log,
                       qtils::SharedRef<payment::PaymentRail> payment_rail,
                       qtils::SharedRef<metrics::Handler> metrics_handler)
      : logger_{logsys->getLogger("RaffleApi", "http")},
        app_config_{std::move(app_config)},
        ledger_{std::move(ledger)},
        coordinator_{std::move(coordinator)},
        event_log_{std::move(event_log)},
        payment_rail_{std::move(payment_rail)},
        metrics_handler_{std::move(metrics_handler)} {}

  http::Response RaffleApi::handle(const http::Request &request) const {
    std::string_view target{request.target()};
    auto question = target.find('?');
    auto path = target.substr(0, question);
    auto query = question == std::string_view::npos
                   ? std::string_view{}
                   : target.substr(question + 1);
    const auto method = request.method();

    auto only = [&](bhttp::verb allowed) {
      return method == allowed;
    };
    auto not_allowed = [] {
      return errorResponse(status::method_not_allowed, "Method not allowed");
    };

    if (path == "/metrics") {
      return only(bhttp::verb::get) ? metrics() : not_allowed();
    }
    if (not path.starts_with(kPrefix)) {
      return errorResponse(status::not_found, "Not found");
    }
    auto route = path.substr(kPrefix.size());

    if (route == "/health") {
      return only(bhttp::verb::get) ? health() : not_allowed();
    }
    if (route == "/state") {
      return only(bhttp::verb::get) ? state() : not_allowed();
    }
    if (route.starts_with("/entrants/")) {
      return only(bhttp::verb::get)
               ? entrant(route.substr(std::string_view{"/entrants/"}.size()))
               : not_allowed();
    }
    if (route == "/enter") {
      return only(bhttp::verb::post) ? enter(request) : not_allowed();
    }
    if (route == "/upkeep") {
      if (method == bhttp::verb::get) {
        return checkUpkeep();
      }
      return only(bhttp::verb::post) ? performUpkeep(request) : not_allowed();
    }
    if (route == "/events") {
      return only(bhttp::verb::get) ? events(query) : not_allowed();
    }
    if (route.starts_with("/balances/")) {
      return only(bhttp::verb::get)
               ? balance(route.substr(std::string_view{"/balances/"}.size()))
               : not_allowed();
    }
    return errorResponse(status::not_found, "Not found");
  }

  http::Response RaffleApi::health() const {
    return jsonResponse(status::ok,
                        R"({"status":"healthy","service":"raffle-api"})");
  }

  http::Response RaffleApi::state() const {
    auto snapshot = ledger_->snapshot();
    const auto &config = ledger_->config();
    auto body = json::write([&](json::Writer &writer) {
      writer.StartObject();
      json::field(writer, "name", app_config_->nodeName());
      json::field(writer, "state", snapshot.state);
      json::field(writer, "entrants", snapshot.entrant_count);
      json::field(writer, "pooledBalance", snapshot.pooled_balance);
      json::field(writer, "lastDrawTimestamp", snapshot.last_draw_timestamp);
      json::field(writer, "recentWinner", snapshot.recent_winner);
      json::field(writer, "pendingRequest", snapshot.pending_request);
      writer.Key("config");
      writer.StartObject();
      json::field(writer, "entranceFee", config.entrance_fee);
      json::field(writer, "interval", config.interval);
      json::field(writer, "gasLane", config.gas_lane);
      json::field(writer, "subscriptionId", config.subscription_id);
      json::field(writer, "requestConfirmations", config.request_confirmations);
      json::field(writer, "callbackGasLimit", config.callback_gas_limit);
      json::field(writer, "numWords", ledger_->numWords());
      writer.EndObject();
      writer.EndObject();
    });
    return jsonResponse(status::ok, std::move(body));
  }

  http::Response RaffleApi::entrant(std::string_view index_str) const {
    auto index = parseNumber<size_t>(index_str);
    if (not index.has_value()) {
      return errorResponse(status::bad_request, "Index must be a number");
    }
    auto res = ledger_->entrantAt(index.value());
    if (res.has_error()) {
      return errorResponse(statusOf(res.error()), res.error().message());
    }
    auto body = json::write([&](json::Writer &writer) {
      writer.StartObject();
      json::field(writer, "index", index.value());
      json::field(writer, "entrant", res.value());
      writer.EndObject();
    });
    return jsonResponse(status::ok, std::move(body));
  }

  http::Response RaffleApi::enter(const http::Request &request) const {
    auto document_res = json::parseObject(request.body());
    if (document_res.has_error()) {
      return errorResponse(status::bad_request,
                           document_res.error().message());
    }
    const json::Json body{document_res.value()};

    auto participant_res = json::requiredString(body, "participant");
    if (participant_res.has_error()) {
      return errorResponse(status::bad_request,
                           fmt::format("participant: {}",
                                       participant_res.error().message()));
    }
    auto participant = util::parseAddress(participant_res.value());
    if (not participant.has_value()) {
      return errorResponse(status::bad_request,
                           "participant: 0x-prefixed 20-byte address expected");
    }

    auto amount_res = json::requiredString(body, "amount");
    if (amount_res.has_error()) {
      return errorResponse(
          status::bad_request,
          fmt::format("amount: {}", amount_res.error().message()));
    }
    auto amount = util::parseAmount(amount_res.value());
    if (not amount.has_value()) {
      return errorResponse(status::bad_request,
                           "amount: expected e.g. 100, 5 gwei, 0.01 ether");
    }

    if (auto res = ledger_->deposit(participant.value(), amount.value());
        res.has_error()) {
      return errorResponse(statusOf(res.error()), res.error().message());
    }
    auto body = json::write([&](json::Writer &writer) {
      writer.StartObject();
      json::field(writer, "participant", participant.value());
      json::field(writer, "entrants", ledger_->entrantCount());
      writer.EndObject();
    });
    return jsonResponse(status::ok, std::move(body));
  }

  http::Response RaffleApi::checkUpkeep() const {
    auto check = coordinator_->evaluateTrigger();
    auto body = json::write([&](json::Writer &writer) {
      writer.StartObject();
      json::field(writer, "upkeepNeeded", check.upkeep_needed);
      json::field(writer, "performData", check.perform_data);
      writer.Key("conditions");
      encodeConditions(writer, check.conditions);
      encodeSnapshot(writer, check.snapshot);
      writer.EndObject();
    });
    return jsonResponse(status::ok, std::move(body));
  }

  http::Response RaffleApi::performUpkeep(const http::Request &request) const {
    qtils::ByteVec perform_data;
    if (not request.body().empty()) {
      auto document_res = json::parseObject(request.body());
      if (document_res.has_error()) {
        return errorResponse(status::bad_request,
                             document_res.error().message());
      }
      auto hex_res =
          json::optionalString(json::Json{document_res.value()}, "performData");
      if (hex_res.has_error()) {
        return errorResponse(status::bad_request,
                             fmt::format("performData: {}",
                                         hex_res.error().message()));
      }
      if (hex_res.value().has_value()
          and not qtils::unhex0x(perform_data, hex_res.value().value(), true)
                      .has_value()) {
        return errorResponse(status::bad_request,
                             "performData: 0x-prefixed hex expected");
      }
    }

    TriggerNotSatisfied rejection;
    auto res = coordinator_->requestDraw(perform_data, &rejection);
    if (res.has_error()) {
      if (res.error() == make_error_code(RaffleError::TRIGGER_NOT_SATISFIED)) {
        auto body = json::write([&](json::Writer &writer) {
          writer.StartObject();
          json::field(writer, "error", res.error().message());
          encodeSnapshot(writer, rejection);
          writer.EndObject();
        });
        return jsonResponse(status::conflict, std::move(body));
      }
      return errorResponse(statusOf(res.error()), res.error().message());
    }
    auto body = json::write([&](json::Writer &writer) {
      writer.StartObject();
      json::field(writer, "requestId", res.value());
      writer.EndObject();
    });
    return jsonResponse(status::ok, std::move(body));
  }

  http::Response RaffleApi::events(std::string_view query) const {
    uint64_t since = 0;
    size_t limit = kDefaultEventsLimit;
    if (auto param = queryParam(query, "since"); param.has_value()) {
      auto value = parseNumber<uint64_t>(param.value());
      if (not value.has_value()) {
        return errorResponse(status::bad_request, "since must be a number");
      }
      since = value.value();
    }
    if (auto param = queryParam(query, "limit"); param.has_value()) {
      auto value = parseNumber<size_t>(param.value());
      if (not value.has_value() or value.value() == 0) {
        return errorResponse(status::bad_request,
                             "limit must be a positive number");
      }
      limit = std::min(value.value(), kMaxEventsLimit);
    }

    auto records = event_log_->since(since, limit);
    auto body = json::write([&](json::Writer &writer) {
      writer.StartObject();
      writer.Key("events");
      writer.StartArray();
      for (const auto &record : records) {
        encodeRecord(writer, record);
      }
      writer.EndArray();
      writer.EndObject();
    });
    return jsonResponse(status::ok, std::move(body));
  }

  http::Response RaffleApi::balance(std::string_view address_str) const {
    auto address = util::parseAddress(address_str);
    if (not address.has_value()) {
      return errorResponse(status::bad_request,
                           "0x-prefixed 20-byte address expected");
    }
    auto amount = payment_rail_->balanceOf(address.value());
    auto body = json::write([&](json::Writer &writer) {
      writer.StartObject();
      json::field(writer, "address", address.value());
      json::field(writer, "balance", amount);
      writer.EndObject();
    });
    return jsonResponse(status::ok, std::move(body));
  }

  http::Response RaffleApi::metrics() const {
    if (not app_config_->metrics().enabled.value_or(false)) {
      return errorResponse(status::not_found, "Metrics are disabled");
    }
    http::Response response{status::ok, 11};
    response.set(bhttp::field::content_type, "text/plain; charset=utf-8");
    response.body() = metrics_handler_->collect();
    return response;
  }

}  // namespace raffle::app
