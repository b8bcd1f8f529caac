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
 * @file runtime.hpp
 * @brief This file declares the state shared by both listeners.
 */
#pragma once
#ifndef NETBOOT_RUNTIME_HPP
#define NETBOOT_RUNTIME_HPP
#include "artifact_store.hpp"
#include "config.hpp"
#include "tftp/session_manager.hpp"

#include <atomic>
#include <cstddef>
#include <utility>
namespace netboot {
/**
 * @brief Everything the TFTP and HTTP services share.
 * @details A runtime outlives both event loops. The configuration and the
 * store are read-only after construction; the session table and the counters
 * are safe to use from any thread.
 */
struct runtime {
  /**
   * @brief Builds the shared state for `conf`.
   * @param conf The server configuration.
   * @param[out] err Set if the artifact root cannot be opened.
   */
  runtime(config conf, std::error_code &err)
      : conf{std::move(conf)}, store{this->conf.root, err},
        sessions{this->conf.max_sessions}
  {}

  /** @brief The server configuration. */
  const config conf;
  /** @brief The artifact store. */
  const artifact_store store;
  /** @brief The live TFTP sessions. */
  tftp::session_manager sessions;
  /** @brief Set when the supervisor starts draining. */
  std::atomic<bool> draining{false};
  /** @brief HTTP responses that have not finished. */
  std::atomic<std::size_t> http_inflight{0};
};
} // namespace netboot
#endif // NETBOOT_RUNTIME_HPP
