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
 * @file supervisor.cpp
 * @brief This file defines the listener supervisor.
 */
#include "netboot/supervisor.hpp"
#include "netboot/detail/socket_address.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <functional>
#include <thread>
namespace netboot {
/** @brief How often the drain loop polls for idleness. */
static constexpr auto DRAIN_POLL = std::chrono::milliseconds(50);

/**
 * @brief Starts one listener and waits for it to come up.
 * @returns The running service, or nullptr if it failed to start.
 */
template <typename Service>
static auto launch(std::string_view name,
                   const detail::socket_address<sockaddr_in6> &address,
                   runtime &rt) -> std::unique_ptr<Service>
{
  using enum net::service::async_context::context_states;
  auto addrbuf = std::array<char, detail::ADDRSTR_LEN>{};
  auto addrstr = detail::to_str(addrbuf, address);

  auto service = std::make_unique<Service>();
  service->start(address, std::ref(rt));
  service->state.wait(PENDING);
  if (service->state != STARTED) [[unlikely]]
  {
    spdlog::critical("{} server failed to start on {}.", name, addrstr);
    return nullptr;
  }

  spdlog::info("{} server listening on {}.", name, addrstr);
  return service;
}

/** @brief Terminates one listener and waits for its loop to exit. */
template <typename Service>
static auto halt(std::unique_ptr<Service> &service) -> void
{
  using enum net::service::async_context::context_states;
  if (!service)
    return;

  service->signal(service->terminate);
  service->state.wait(STARTED);
  service.reset();
}

supervisor::~supervisor() { stop(); }

auto supervisor::start(std::error_code &err) -> void
{
  const auto &conf = rt_.conf;
  err.clear();

  if (conf.enable_tftp)
  {
    auto address = detail::make_address(conf.address, conf.tftp_port, err);
    if (err)
      return;

    tftp_ = launch<tftp_service>("TFTP", address, rt_);
    if (!tftp_)
    {
      err = std::make_error_code(std::errc::address_not_available);
      return;
    }
  }

  if (conf.enable_http)
  {
    auto address = detail::make_address(conf.address, conf.http_port, err);
    if (err)
      return;

    http_ = launch<http_service>("HTTP", address, rt_);
    if (!http_)
      err = std::make_error_code(std::errc::address_not_available);
  }
}

auto supervisor::stopped() const -> bool
{
  using enum net::service::async_context::context_states;
  return (tftp_ && tftp_->state == STOPPED) ||
         (http_ && http_->state == STOPPED);
}

auto supervisor::shutdown() -> void
{
  using clock = std::chrono::steady_clock;

  rt_.draining = true;
  spdlog::info("Shutting down: {} TFTP session(s) and {} HTTP response(s) "
               "in flight.",
               rt_.sessions.size(), rt_.http_inflight.load());

  const auto deadline = clock::now() + rt_.conf.grace;
  while (rt_.sessions.size() > 0 || rt_.http_inflight > 0)
  {
    if (clock::now() >= deadline)
    {
      spdlog::warn("Grace period expired with {} TFTP session(s) and {} "
                   "HTTP response(s) unfinished.",
                   rt_.sessions.size(), rt_.http_inflight.load());
      break;
    }

    std::this_thread::sleep_for(DRAIN_POLL);
  }

  stop();
  spdlog::info("Server stopped.");
}

auto supervisor::stop() -> void
{
  halt(tftp_);
  halt(http_);
}
} // namespace netboot
