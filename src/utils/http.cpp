/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/http.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

namespace raffle::http {
  namespace {
    using boost::asio::awaitable;
    constexpr auto use_tuple = boost::asio::as_tuple(boost::asio::use_awaitable);

    awaitable<void> session(log::Logger log,
                            boost::asio::ip::tcp::socket socket,
                            ServerConfig config) {
      boost::beast::tcp_stream stream{std::move(socket)};
      boost::beast::flat_buffer buffer;
      while (true) {
        boost::beast::http::request_parser<Body> parser;
        parser.body_limit(config.max_request_size);
        stream.expires_after(config.operation_timeout);
        auto [read_ec, read_size] = co_await boost::beast::http::async_read(
            stream, buffer, parser, use_tuple);
        if (read_ec == boost::beast::http::error::end_of_stream) {
          break;
        }
        if (read_ec) {
          SL_WARN(log, "http read request error: {}", read_ec.message());
          break;
        }

        auto request = parser.release();
        const auto version = request.version();
        const auto keep_alive = request.keep_alive();
        auto response = config.on_request(std::move(request));
        response.version(version);
        response.keep_alive(keep_alive);
        response.prepare_payload();

        stream.expires_after(config.operation_timeout);
        auto [write_ec, write_size] = co_await boost::beast::http::async_write(
            stream, response, use_tuple);
        if (write_ec) {
          SL_WARN(log, "http write response error: {}", write_ec.message());
          break;
        }
        if (not keep_alive) {
          break;
        }
      }
      boost::system::error_code ec;
      stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send,
                               ec);
    }
  }  // namespace

  outcome::result<void> serve(log::Logger log,
                              boost::asio::io_context &io_context,
                              ServerConfig config) {
    boost::asio::ip::tcp::acceptor acceptor{io_context};
    boost::system::error_code ec;
    acceptor.open(config.endpoint.protocol(), ec);
    if (ec) {
      return ec;
    }
    acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      return ec;
    }
    acceptor.bind(config.endpoint, ec);
    if (ec) {
      return ec;
    }
    acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      return ec;
    }
    boost::asio::co_spawn(
        io_context,
        [log, config, acceptor{std::move(acceptor)}]() mutable
            -> awaitable<void> {
          while (true) {
            auto [accept_ec, socket] =
                co_await acceptor.async_accept(use_tuple);
            if (accept_ec) {
              if (accept_ec != boost::asio::error::operation_aborted) {
                SL_WARN(log, "tcp accept error: {}", accept_ec.message());
              }
              break;
            }
            boost::asio::co_spawn(acceptor.get_executor(),
                                  session(log, std::move(socket), config),
                                  boost::asio::detached);
          }
        },
        boost::asio::detached);
    return outcome::success();
  }
}  // namespace raffle::http
