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
 * @file supervisor.hpp
 * @brief This file declares the listener supervisor.
 */
#pragma once
#ifndef NETBOOT_SUPERVISOR_HPP
#define NETBOOT_SUPERVISOR_HPP
#include "http_server.hpp"
#include "runtime.hpp"
#include "tftp_server.hpp"

#include <memory>
#include <system_error>
namespace netboot {
/**
 * @brief Runs the TFTP and HTTP listeners, each on its own event loop.
 */
class supervisor {
public:
  /** @brief The TFTP event loop. */
  using tftp_service = net::service::context_thread<tftp::server>;
  /** @brief The HTTP event loop. */
  using http_service = net::service::context_thread<http::server>;

  /**
   * @brief Creates a supervisor over shared state.
   * @param rt The shared state, which must outlive the supervisor.
   */
  explicit supervisor(runtime &rt) noexcept : rt_{rt} {}

  supervisor(const supervisor &) = delete;
  auto operator=(const supervisor &) -> supervisor & = delete;

  /** @brief Stops any listener that is still running. */
  ~supervisor();

  /**
   * @brief Binds and starts the enabled listeners.
   * @param[out] err Set to std::errc::invalid_argument for a bad bind
   * address or std::errc::address_not_available if a listener failed to
   * start. Listeners that did start keep running.
   */
  auto start(std::error_code &err) -> void;

  /** @returns true if a started listener has stopped on its own. */
  [[nodiscard]] auto stopped() const -> bool;

  /**
   * @brief Drains and stops both listeners.
   * @details New work is refused immediately. Live TFTP sessions and HTTP
   * responses get up to the grace period to finish before the event loops
   * are terminated.
   */
  auto shutdown() -> void;

private:
  /** @brief The shared state. */
  runtime &rt_;
  /** @brief The TFTP event loop, if enabled. */
  std::unique_ptr<tftp_service> tftp_;
  /** @brief The HTTP event loop, if enabled. */
  std::unique_ptr<http_service> http_;

  /** @brief Terminates both event loops and waits for them. */
  auto stop() -> void;
};
} // namespace netboot
#endif // NETBOOT_SUPERVISOR_HPP
