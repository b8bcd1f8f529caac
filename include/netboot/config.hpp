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
 * @file config.hpp
 * @brief This file declares the server configuration.
 */
#pragma once
#ifndef NETBOOT_CONFIG_HPP
#define NETBOOT_CONFIG_HPP
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
/** @namespace For top-level netboot services. */
namespace netboot {
/**
 * @brief Immutable server configuration.
 * @details A config value is built once at startup and handed by reference
 * to every component that needs it.
 */
struct config {
  /** @brief Default TFTP port. */
  static constexpr std::uint16_t TFTP_PORT = 69;
  /** @brief Default HTTP port. */
  static constexpr std::uint16_t HTTP_PORT = 8080;
  /** @brief Smallest block size allowed by RFC 2348. */
  static constexpr std::size_t BLKSIZE_MIN = 8;
  /** @brief Largest block size allowed by RFC 2348. */
  static constexpr std::size_t BLKSIZE_MAX = 65464;

  /** @brief The artifact root directory. */
  std::filesystem::path root = ".";
  /** @brief The bind address shared by both listeners. */
  std::string address = "0.0.0.0";
  /** @brief The TFTP UDP port. */
  std::uint16_t tftp_port = TFTP_PORT;
  /** @brief The HTTP TCP port. */
  std::uint16_t http_port = HTTP_PORT;
  /** @brief Whether the TFTP listener is enabled. */
  bool enable_tftp = true;
  /** @brief Whether the HTTP listener is enabled. */
  bool enable_http = true;
  /** @brief Smallest negotiable TFTP block size. */
  std::size_t blksize_min = BLKSIZE_MIN;
  /** @brief Largest negotiable TFTP block size. */
  std::size_t blksize_max = BLKSIZE_MAX;
  /** @brief Concurrent TFTP session ceiling. */
  std::size_t max_sessions = 64;
  /** @brief Default retransmission interval. */
  std::chrono::seconds timeout{1};
  /** @brief Retransmission budget per outstanding datagram. */
  unsigned retries = 5;
  /** @brief Sessions idle for longer than this are evicted. */
  std::chrono::seconds idle_timeout{30};
  /** @brief Per-connection HTTP request timeout. */
  std::chrono::seconds http_timeout{30};
  /** @brief Shutdown grace period. */
  std::chrono::seconds grace{5};
};

/**
 * @brief Parses the command line into a config.
 * @details Diagnostics and the usage text are written to `err`; `--help`
 * writes the usage text to `out`.
 * @param argc The number of command-line arguments.
 * @param argv The command-line arguments.
 * @param out The stream for help output.
 * @param err The stream for diagnostics.
 * @returns A validated config, or std::nullopt if the program should exit.
 */
auto parse_args(int argc, char const *const *argv, std::ostream &out,
                std::ostream &err) -> std::optional<config>;

/**
 * @brief Sets the spdlog level from a level name.
 * @param value The (case-insensitive) level name.
 * @param err The stream for diagnostics.
 * @returns 0 on success, -1 if the level is not recognized.
 */
auto set_loglevel(std::string_view value, std::ostream &err) -> int;
} // namespace netboot
#endif // NETBOOT_CONFIG_HPP
