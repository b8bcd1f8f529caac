/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * netboot is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * netboot is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with netboot.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file http_server.hpp
 * @brief This file declares the HTTP server.
 */
#pragma once
#ifndef NETBOOT_HTTP_SERVER_HPP
#define NETBOOT_HTTP_SERVER_HPP
#include "protocol/http_protocol.hpp"
#include "runtime.hpp"

#include <net/cppnet.hpp>
#include <net/timers/timers.hpp>

#include <map>
namespace netboot::http {
/** @brief Size of the stream read buffer. */
static constexpr auto BUFSIZE = 4096UL;
/** @brief The TCP service base. */
template <typename TCPStreamHandler>
using tcp_base = net::service::async_tcp_service<TCPStreamHandler, BUFSIZE>;

/**
 * @brief A static HTTP/1.1 server for boot artifacts.
 * @details Each connection carries one request. The response body is read
 * from the artifact in CHUNK_SIZE pieces, each sent once the previous one
 * has been written, and the connection is closed afterwards.
 */
class server : public tcp_base<server> {
public:
  /** @brief The cppnet TCP service. */
  using Base = tcp_base<server>;
  /** @brief The socket message type. */
  using socket_message = io::socket::socket_message<sockaddr_in6>;
  /** @brief The native socket type. */
  using socket_type = io::socket::native_socket_type;
  /** @brief The timer type. */
  using timer_id = net::timers::timer_id;

  /**
   * @brief Binds the listener to address.
   * @tparam T The type of the socket_address.
   * @param address The local IP address to bind to.
   * @param rt The shared server state.
   */
  template <typename T>
  server(socket_address<T> address, runtime &rt) noexcept
      : Base(address), rt_{rt}
  {}

  /**
   * @brief Services bytes read from a connection.
   * @param ctx The asynchronous context of the connection.
   * @param socket The connected socket.
   * @param rctx Owns the receive buffer.
   * @param buf The bytes that were read, empty at end of stream.
   */
  auto operator()(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf) -> void;

private:
  /** @brief Per-connection state. */
  struct connection {
    /** @brief The printable peer address. */
    std::string peer;
    /** @brief The request bytes received so far. */
    std::string head;
    /** @brief The request line, for the access log. */
    std::string request_line;
    /** @brief The bytes waiting to be written. */
    std::vector<char> out;
    /** @brief How much of out has been written. */
    std::size_t sent = 0;
    /** @brief Body bytes still to come from the artifact. */
    std::shared_ptr<artifact_stream> stream;
    /** @brief The request timeout. */
    timer_id timer{net::timers::INVALID_TIMER};
    /** @brief The response status, 0 until a response is started. */
    std::uint16_t status = 0;
  };

  /** @brief The shared server state. */
  runtime &rt_;
  /** @brief Open connections. */
  std::map<socket_type, connection> connections_;

  /**
   * @brief Starts sending a response.
   * @param ctx The asynchronous context of the connection.
   * @param socket The connected socket.
   * @param conn The connection.
   * @param res The response.
   * @param head_only Whether the body is suppressed.
   */
  auto respond(async_context &ctx, const socket_dialog &socket,
               connection &conn, response res, bool head_only) -> void;

  /**
   * @brief Writes pending bytes, refilling from the artifact stream.
   * @param ctx The asynchronous context of the connection.
   * @param socket The connected socket.
   */
  auto write(async_context &ctx, const socket_dialog &socket) -> void;

  /**
   * @brief Closes a connection and forgets its state.
   * @param ctx The asynchronous context of the connection.
   * @param socket The connected socket.
   */
  auto close(async_context &ctx, const socket_dialog &socket) -> void;
};
} // namespace netboot::http
#endif // NETBOOT_HTTP_SERVER_HPP
