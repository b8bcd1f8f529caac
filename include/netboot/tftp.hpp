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
 * @file tftp.hpp
 * @brief This file declares TFTP application logic.
 */
#pragma once
#ifndef NETBOOT_TFTP_HPP
#define NETBOOT_TFTP_HPP
#include "netboot/artifact_store.hpp"
#include "netboot/config.hpp"
#include "protocol/tftp_protocol.hpp"
#include "protocol/tftp_session.hpp"
namespace netboot::tftp {
/**
 * @brief Processes a read request.
 * @details On success the session buffer holds the first datagram to send:
 * an OACK if any option was accepted, DATA block 1 otherwise.
 * @param req The TFTP request to process.
 * @param store The artifact store to read from.
 * @param conf The server configuration.
 * @param sess The session to initialize.
 * @returns 0 if successful, a non-zero TFTP error otherwise.
 */
auto handle_request(const messages::request &req, const artifact_store &store,
                    const config &conf, session &sess) -> std::uint16_t;

/**
 * @brief Processes an ack message.
 * @details An ACK for the outstanding block loads the next block into the
 * session buffer and resets the retry count, or marks the session COMPLETED
 * if the outstanding block was the last one. Any other ACK is ignored.
 * @param ack The TFTP ack to process (in network byte order).
 * @param sess The session.
 * @returns 0 if successful, a non-zero TFTP error otherwise.
 */
auto handle_ack(messages::ack ack, session &sess) -> std::uint16_t;

/**
 * @brief Processes a retransmission timeout.
 * @param sess The session.
 * @param max_retries The retransmission budget.
 * @returns 0 if the buffer should be resent, TIMED_OUT if the session has
 * run out of retries.
 */
auto handle_timeout(session &sess, unsigned max_retries) -> std::uint16_t;

/**
 * @brief Applies RFC 2347 option negotiation to a session.
 * @details Recognized options are clamped to the server bounds. Unknown and
 * unparseable options are dropped, as are repeats of an option.
 * @param options The requested options.
 * @param conf The server configuration.
 * @param sess The session. Its target must already be resolved.
 * @returns The accepted options, in request order.
 */
auto negotiate(std::span<const messages::option> options, const config &conf,
               session &sess) -> std::vector<std::pair<std::string, std::string>>;
} // namespace netboot::tftp
#endif // NETBOOT_TFTP_HPP
