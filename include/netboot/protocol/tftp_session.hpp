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
 * @file tftp_session.hpp
 * @brief This file defines the TFTP session state.
 */
#pragma once
#ifndef NETBOOT_TFTP_SESSION_HPP
#define NETBOOT_TFTP_SESSION_HPP
#include "netboot/artifact_store.hpp"
#include "tftp_protocol.hpp"

#include <net/timers/timers.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>
namespace netboot::tftp {
/**
 * @brief Represents a single TFTP read transfer.
 */
struct session {
  /** @brief The session clock. */
  using clock = std::chrono::steady_clock;
  /** @brief The session timestamp. */
  using timestamp = clock::time_point;
  /** @brief The session timer. */
  using timer_id = net::timers::timer_id;
  /** @brief The invalid timer value. */
  static constexpr auto INVALID_TIMER = net::timers::INVALID_TIMER;
  /** @brief The native socket type. */
  using socket_type = io::socket::native_socket_type;
  /** @brief The invalid socket constant. */
  static constexpr auto INVALID_SOCKET = io::socket::INVALID_SOCKET;

  /** @brief The transfer state tag. */
  enum status_t : std::uint8_t {
    /** @brief An OACK is outstanding. */
    NEGOTIATING = 1,
    /** @brief DATA blocks are being sent. */
    TRANSFERRING,
    /** @brief The final block was acknowledged. */
    COMPLETED,
    /** @brief The transfer failed and will be removed. */
    ERRORED
  };

  /** @brief The session state. */
  struct state_t {
    /** @brief The artifact being transferred. */
    artifact target;
    /** @brief The bounded stream over the artifact. */
    std::shared_ptr<artifact_stream> file;
    /** @brief The last datagram sent (OACK or DATA). */
    std::vector<char> buffer;
    /** @brief The negotiated block size. */
    std::size_t blksize = messages::DATALEN;
    /** @brief The retransmission interval. */
    std::chrono::seconds timeout{1};
    /** @brief Last client activity, used for idle eviction. */
    timestamp last_activity{clock::now()};
    /** @brief The retransmission timer. */
    timer_id timer{INVALID_TIMER};
    /** @brief The transfer socket that the session is bound to. */
    socket_type socket{INVALID_SOCKET};
    /** @brief Consecutive retransmissions of the buffer. */
    unsigned retries = 0;
    /** @brief The block number of the buffer (0 for an OACK). */
    std::uint16_t block_num = 0;
    /** @brief The transfer state. */
    std::uint8_t status = NEGOTIATING;
    /** @brief Set once the short (final) block has been read. */
    bool last_block = false;
  };

  /** @brief The session state. */
  state_t state;
};

} // namespace netboot::tftp
#endif // NETBOOT_TFTP_SESSION_HPP
