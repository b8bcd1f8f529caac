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
 * @file session_manager.hpp
 * @brief This file declares the TFTP session table.
 */
#pragma once
#ifndef NETBOOT_SESSION_MANAGER_HPP
#define NETBOOT_SESSION_MANAGER_HPP
#include "netboot/protocol/tftp_session.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>
namespace netboot::tftp {
/**
 * @brief Owns the live TFTP sessions, keyed by client endpoint.
 * @details All members are safe to call from any thread. Sessions are
 * handed out by shared pointer so that a session removed by one thread stays
 * valid for a caller that still holds it.
 */
class session_manager {
public:
  /** @brief The client endpoint type. */
  using key_type = io::socket::socket_address<sockaddr_in6>;
  /** @brief The shared session handle. */
  using session_ptr = std::shared_ptr<session>;
  /** @brief A session together with its endpoint. */
  using entry = std::pair<key_type, session_ptr>;

  /**
   * @brief Constructs an empty table.
   * @param max_sessions The concurrency ceiling.
   */
  explicit session_manager(std::size_t max_sessions) noexcept
      : max_sessions_{max_sessions}
  {}

  /**
   * @brief Adds a session for `key` if none exists.
   * @param key The client endpoint.
   * @param[out] err Set to std::errc::address_in_use if the endpoint already
   * has a session, or std::errc::resource_unavailable_try_again if the table
   * is full.
   * @param sess A prepared session, or a fresh one if omitted.
   * @returns The stored session, empty on error.
   */
  [[nodiscard]] auto
  create_if_absent(const key_type &key, std::error_code &err,
                   session_ptr sess = std::make_shared<session>())
      -> session_ptr;

  /**
   * @brief Looks up the session for `key`.
   * @param key The client endpoint.
   * @returns The session, or an empty pointer.
   */
  [[nodiscard]] auto lookup(const key_type &key) const -> session_ptr;

  /**
   * @brief Removes the session for `key`.
   * @param key The client endpoint.
   * @returns The removed session, or an empty pointer if there was none.
   */
  auto remove(const key_type &key) -> session_ptr;

  /** @returns The number of live sessions. */
  [[nodiscard]] auto size() const -> std::size_t;

  /**
   * @brief Evicts sessions with no activity for longer than `idle`.
   * @param now The current time.
   * @param idle The idle bound.
   * @returns The evicted sessions.
   */
  auto sweep(session::timestamp now,
             session::clock::duration idle) -> std::vector<entry>;

private:
  /** @brief Serializes access to sessions_. */
  mutable std::mutex mtx_;
  /** @brief The session table. */
  std::map<key_type, session_ptr> sessions_;
  /** @brief The concurrency ceiling. */
  std::size_t max_sessions_;
};
} // namespace netboot::tftp
#endif // NETBOOT_SESSION_MANAGER_HPP
