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
 * @file tftp_server.hpp
 * @brief The TFTP listener and its per-session transfer sockets.
 */
#pragma once
#ifndef NETBOOT_TFTP_SERVER_HPP
#define NETBOOT_TFTP_SERVER_HPP
#include "runtime.hpp"
#include "tftp.hpp"

#include <net/cppnet.hpp>

#include <map>
/** @brief The read-only TFTP service. */
namespace netboot::tftp {
/** @brief Size of the datagram read buffer, enough for any RRQ. */
static constexpr auto BUFSIZE = 2048UL;
/** @brief The UDP service base. */
template <typename UDPStreamHandler>
using udp_base = net::service::async_udp_service<UDPStreamHandler, BUFSIZE>;

/**
 * @brief A read-only TFTP server.
 * @details RRQs arrive on the listening socket. Each accepted RRQ gets its
 * own transfer socket, which is the server's transfer ID for that session.
 */
class server : public udp_base<server> {
public:
  /** @brief The cppnet UDP service. */
  using Base = udp_base<server>;
  /** @brief A datagram with its peer address. */
  using socket_message = io::socket::socket_message<sockaddr_in6>;
  /** @brief The client endpoint type. */
  using key_type = session_manager::key_type;
  /** @brief The shared session handle. */
  using session_ptr = session_manager::session_ptr;

  /**
   * @brief Binds the listener to address.
   * @tparam T sockaddr_in or sockaddr_in6.
   * @param address The listening address.
   * @param rt The shared server state.
   */
  template <typename T>
  server(socket_address<T> address, runtime &rt) noexcept
      : Base(address), rt_{rt}
  {}

  /**
   * @brief Routes a datagram to the listener or to its session.
   * @param ctx The service context.
   * @param socket The receiving socket.
   * @param rctx Owns the receive buffer.
   * @param buf The datagram.
   */
  auto operator()(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf) -> void;

private:
  /** @brief The shared server state. */
  runtime &rt_;
  /** @brief The transfer sockets of live sessions. */
  std::map<session::socket_type, socket_dialog> transfers_;
  /** @brief The idle sweep timer, armed while sessions exist. */
  session::timer_id sweeper_{session::INVALID_TIMER};

  /**
   * @brief Services a request read off the listening socket.
   * @param ctx The service context.
   * @param socket The listening socket.
   * @param buf The data buffer containing the request.
   * @param key The client endpoint.
   */
  auto request(async_context &ctx, const socket_dialog &socket,
               std::span<const std::byte> buf, const key_type &key) -> void;

  /**
   * @brief Services a datagram read off a transfer socket.
   * @param ctx The service context.
   * @param socket The transfer socket.
   * @param rctx Owns the receive buffer.
   * @param buf The datagram.
   * @param key The endpoint that sent the datagram.
   */
  auto service(async_context &ctx, const socket_dialog &socket,
               const std::shared_ptr<read_context> &rctx,
               std::span<const std::byte> buf, const key_type &key) -> void;

  /**
   * @brief Advances a transfer on an ACK.
   * @param ctx The service context.
   * @param socket The transfer socket.
   * @param rctx Owns the receive buffer.
   * @param msg The ACK datagram.
   * @param key The client endpoint.
   * @param sess The session.
   */
  auto ack(async_context &ctx, const socket_dialog &socket,
           const std::shared_ptr<read_context> &rctx,
           std::span<const std::byte> msg, const key_type &key,
           const session_ptr &sess) -> void;

  /**
   * @brief Sends an error notice to the client and ends the session.
   * @param ctx The service context.
   * @param socket The transfer socket.
   * @param key The client endpoint.
   * @param sess The session.
   * @param error An error_t value.
   */
  auto error(async_context &ctx, const socket_dialog &socket,
             const key_type &key, const session_ptr &sess,
             std::uint16_t error) -> void;

  /**
   * @brief Tears a session down and releases its socket.
   * @param ctx The service context.
   * @param socket The transfer socket.
   * @param key The client endpoint.
   * @param sess The session to clean up.
   */
  auto cleanup(async_context &ctx, const socket_dialog &socket,
               const key_type &key, const session_ptr &sess) -> void;

  /**
   * @brief (Re)starts the retransmission timer of a session.
   * @param ctx The asynchronous context of the session.
   * @param socket The transfer socket.
   * @param key The client endpoint.
   * @param sess The session.
   */
  auto retransmit(async_context &ctx, const socket_dialog &socket,
                  const key_type &key, const session_ptr &sess) -> void;

  /**
   * @brief Starts the idle sweep if it is not already running.
   * @param ctx The asynchronous context.
   */
  auto sweep(async_context &ctx) -> void;

  /**
   * @brief Sends a datagram to the client.
   * @param ctx The service context.
   * @param socket The socket to send on.
   * @param key The client endpoint.
   * @param buf The datagram.
   * @param owner Keeps buf alive until the send completes.
   */
  static auto send(async_context &ctx, const socket_dialog &socket,
                   const key_type &key, std::span<const char> buf,
                   std::shared_ptr<const void> owner = {}) -> void;
};
} // namespace netboot::tftp
#endif // NETBOOT_TFTP_SERVER_HPP
