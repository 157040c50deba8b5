/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/http_server.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "app/impl/raffle_api.hpp"
#include "app/state_manager.hpp"
#include "utils/http.hpp"

namespace raffle::app {
  HttpServer::HttpServer(qtils::SharedRef<log::LoggingSystem> logsys,
                         qtils::SharedRef<StateManager> state_manager,
                         qtils::SharedRef<Configuration> app_config,
                         qtils::SharedRef<RaffleApi> api)
      : log_{logsys->getLogger("HttpServer", "http")},
        app_config_{std::move(app_config)},
        api_{std::move(api)} {
    state_manager->takeControl(*this);
  }

  HttpServer::~HttpServer() {
    stop();
  }

  bool HttpServer::start() {
    io_context_ = std::make_shared<boost::asio::io_context>();
    http::ServerConfig config{
        .endpoint = app_config_->api().endpoint,
        .on_request =
            [weak_self{weak_from_this()}](http::Request request) {
              auto self = weak_self.lock();
              if (not self) {
                http::Response response;
                response.result(boost::beast::http::status::bad_gateway);
                return response;
              }
              auto response = self->api_->handle(request);
              SL_DEBUG(self->log_,
                       "{} {} -> {}",
                       std::string_view{request.method_string()},
                       std::string_view{request.target()},
                       response.result_int());
              return response;
            },
    };
    auto listen_res = http::serve(log_, *io_context_, config);
    if (not listen_res.has_value()) {
      SL_CRITICAL(log_,
                  "Can't listen on {}:{}: {}",
                  config.endpoint.address().to_string(),
                  config.endpoint.port(),
                  listen_res.error());
      return false;
    }
    SL_INFO(log_,
            "API listening on http://{}:{}",
            config.endpoint.address().to_string(),
            config.endpoint.port());
    io_thread_.emplace([io_context{io_context_}] {
      soralog::util::setThreadName("http");
      auto work_guard = boost::asio::make_work_guard(*io_context);
      io_context->run();
    });
    return true;
  }

  void HttpServer::stop() {
    if (io_thread_.has_value()) {
      io_context_->stop();
      io_thread_->join();
      io_thread_.reset();
    }
  }
}  // namespace raffle::app
