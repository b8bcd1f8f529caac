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
 * @file tftp_protocol.hpp
 * @brief TFTP wire formats, error packets and request parsing.
 */
#pragma once
#ifndef NETBOOT_TFTP_PROTOCOL_HPP
#define NETBOOT_TFTP_PROTOCOL_HPP
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>
/** @brief The read-only TFTP service. */
namespace netboot::tftp {
// NOLINTBEGIN(performance-enum-size)
/** @brief TFTP packet layouts and protocol constants. */
struct messages {
  /**
   * @brief Packet opcodes.
   * RFC 1350 opcodes plus the option acknowledgment from RFC 2347.
   */
  enum opcode_t : std::uint16_t { RRQ = 1, WRQ, DATA, ACK, ERROR, OACK };

  /**
   * @brief Transfer modes named in a request.
   * Only OCTET is served; the others are parsed so they can be refused.
   */
  enum mode_t : std::uint8_t { NETASCII = 1, OCTET, MAIL };

  /**
   * @brief Error codes, RFC 1350 codes 0-7 and RFC 2347 code 8.
   */
  enum error_t : std::uint16_t {
    NOT_DEFINED = 0,
    FILE_NOT_FOUND,
    ACCESS_VIOLATION,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_ALREADY_EXISTS,
    NO_SUCH_USER,
    OPTION_NEGOTIATION,
    // Errors below this point are server conditions that go out on the wire
    // as one of the codes above (see errors::code).
    TIMED_OUT,
    IO_ERROR,
    ALREADY_IN_USE,
    SERVER_BUSY,
    SHUTTING_DOWN
  };

  /** @brief A negotiable option as it appears on the wire. */
  using option = std::pair<std::string_view, std::string_view>;

  /**
   * @brief A parsed read or write request.
   * @details The string views point into the datagram they were parsed from.
   */
  struct request {
    /** @brief RRQ or WRQ. */
    std::uint16_t opc = 0;
    /** @brief Transfer mode (NETASCII, OCTET, or MAIL), 0 if unknown. */
    std::uint8_t mode = 0;
    /** @brief The requested filename. */
    std::string_view filename;
    /** @brief RFC 2347 option pairs in request order. */
    std::vector<option> options;
  };

  /**
   * @brief Fixed header of an ERROR packet.
   */
  struct error {
    /** @brief ERROR, network order. */
    std::uint16_t opc;
    /** @brief Wire error code, network order. */
    std::uint16_t error;
  };

  /**
   * @brief Fixed header of a DATA packet.
   */
  struct data {
    /** @brief DATA, network order. */
    std::uint16_t opc;
    /** @brief Block number, wraps after 65535. */
    std::uint16_t block_num;
  };

  /**
   * @brief An ACK is laid out like a DATA header with no payload.
   */
  using ack = data;

  /** @brief The default data payload size in bytes (RFC 1350). */
  static constexpr auto DATALEN = 512UL;
  /** @brief The smallest timeout a client may negotiate (RFC 2349). */
  static constexpr auto TIMEOUT_MIN = 1UL;
  /** @brief The largest timeout a client may negotiate (RFC 2349). */
  static constexpr auto TIMEOUT_MAX = 255UL;
};
// NOLINTEND(performance-enum-size)

/** @brief Prebuilt ERROR packets and error code helpers. */
struct errors {
  // NOLINTBEGIN
  /**
   * @brief Builds an ERROR packet at compile time.
   * @tparam N Size of the message literal, terminator included.
   * @param error Wire error code.
   * @param str Message text.
   * @returns The encoded packet.
   */
  template <std::size_t N>
  static constexpr auto msg(const std::uint16_t error,
                            const char (&str)[N]) noexcept
  {
    using enum messages::opcode_t;
    constexpr auto bufsize = sizeof(messages::error) + N;

    auto buf = std::array<char, bufsize>();
    buf[0] = 0;
    buf[1] = static_cast<char>(ERROR);
    buf[2] = static_cast<char>(error >> 8);
    buf[3] = static_cast<char>(error & 0xFF);

    auto it = buf.begin() + sizeof(messages::error);
    for (auto ch : str)
    {
      *it++ = ch;
    }

    return buf;
  }
  // NOLINTEND

  /**
   * @brief Human readable text for an error, used in logs.
   * @param error An error_t value.
   * @returns Static text.
   */
  static constexpr auto errstr(std::uint16_t error) noexcept -> std::string_view
  {
    using enum messages::error_t;
    switch (error)
    {
      case ACCESS_VIOLATION:
        return "Access violation.";

      case FILE_NOT_FOUND:
        return "File not found.";

      case DISK_FULL:
        return "Disk full.";

      case NO_SUCH_USER:
        return "No such user.";

      case FILE_ALREADY_EXISTS:
        return "File already exists.";

      case UNKNOWN_TID:
        return "Unknown TID.";

      case ILLEGAL_OPERATION:
        return "Illegal operation.";

      case OPTION_NEGOTIATION:
        return "Option negotiation failed.";

      case TIMED_OUT:
        return "Timed out.";

      case IO_ERROR:
        return "I/O error.";

      case ALREADY_IN_USE:
        return "Already in use.";

      case SERVER_BUSY:
        return "Server busy.";

      case SHUTTING_DOWN:
        return "Server shutting down.";

      default:
        return "Not defined.";
    }
  }

  /**
   * @brief Maps an error to the code sent on the wire.
   * @param error An error_t value.
   * @returns The RFC 1350 error code.
   */
  static constexpr auto code(std::uint16_t error) noexcept -> std::uint16_t
  {
    using enum messages::error_t;
    if (error == SERVER_BUSY)
      return DISK_FULL;

    if (error > OPTION_NEGOTIATION)
      return NOT_DEFINED;

    return error;
  }

  /**
   * @brief Looks up the ERROR packet sent for an error.
   * @details TIMED_OUT has no packet: a transfer that ran out of retries is
   * dropped without notifying the client.
   * @param error An error_t value.
   * @returns A view of a static packet, empty if nothing should be sent.
   */
  static auto packet(std::uint16_t error) noexcept -> std::span<const char>;

  /**
   * @brief The "Access violation" packet.
   * @details Sent for WRQs and paths outside the root.
   * @return The encoded packet, built once.
   */
  static auto access_violation() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(ACCESS_VIOLATION, "Access violation.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief The "File not found" packet.
   * @return The encoded packet, built once.
   */
  static auto file_not_found() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(FILE_NOT_FOUND, "File not found.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief The "Illegal operation" packet.
   * @details Sent for transfer modes other than octet.
   * @return The encoded packet, built once.
   */
  static auto illegal_operation() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(ILLEGAL_OPERATION, "Illegal operation.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief The "Unknown TID" packet.
   * @details Sent when a transfer socket receives a datagram from a port
   * other than the one its session belongs to.
   * @return The encoded packet, built once.
   */
  static auto unknown_tid() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(UNKNOWN_TID, "Unknown TID.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief The "Already in use" packet.
   * @details Sent when an RRQ arrives from an endpoint that already has a
   * transfer in flight.
   * @return The encoded packet, built once.
   */
  static auto already_in_use() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(code(ALREADY_IN_USE), "Already in use.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief The "Server busy" packet.
   * @details The session ceiling has been reached. The disk full code is
   * the closest RFC 1350 has to resource exhaustion.
   * @return The encoded packet, built once.
   */
  static auto server_busy() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(code(SERVER_BUSY), "Server busy.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief The "Server shutting down" packet.
   * @return The encoded packet, built once.
   */
  static auto shutting_down() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf =
        msg(code(SHUTTING_DOWN), "Server shutting down.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief The "I/O error" packet.
   * @details The artifact could not be read after the transfer started.
   * @return The encoded packet, built once.
   */
  static auto io_error() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(code(IO_ERROR), "I/O error.");
    return static_cast<const decltype(buf) &>(buf);
  }
};

/**
 * @brief Parses an RRQ or WRQ datagram.
 * @details The filename, the mode and each option name and value must be
 * NUL terminated inside the datagram. A trailing option name without a
 * value makes the request malformed.
 * @param msg The datagram.
 * @returns The request, with opc set to 0 if the datagram is malformed.
 */
auto parse_request(std::span<const std::byte> msg) -> messages::request;

/**
 * @brief Converts a mode string to a TFTP mode.
 * @details Comparison is case-insensitive and "binary" is an alias for
 * "octet".
 * @param mode The mode string.
 * @returns The mode, or 0 if it is not recognized.
 */
auto to_mode(std::string_view mode) noexcept -> std::uint8_t;
} // namespace netboot::tftp
#endif // NETBOOT_TFTP_PROTOCOL_HPP
