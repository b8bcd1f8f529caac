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
 * @file main.cpp
 * @brief The netbootd entry point.
 */
#include "netboot/config.hpp"
#include "netboot/runtime.hpp"
#include "netboot/supervisor.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstring>
#include <format>
#include <iostream>
#include <span>
#include <string_view>

#include <pthread.h>
using namespace netboot;

/** @brief The signals that start a graceful shutdown. */
static auto signal_mask() -> const sigset_t *
{
  static const auto set = [] {
    auto set = sigset_t{};
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGINT);
    return set;
  }();
  return &set;
}

/**
 * @brief Blocks until a shutdown signal arrives or a listener dies.
 * @returns The signal number, or 0 if a listener stopped by itself.
 */
static auto wait_for_shutdown(const supervisor &server) -> int
{
  static const auto timeout = timespec{.tv_sec = 0, .tv_nsec = 50000000};

  while (!server.stopped())
  {
    switch (auto signum = sigtimedwait(signal_mask(), nullptr, &timeout))
    {
      case SIGTERM:
      case SIGHUP:
      case SIGINT:
        return signum;

      default:
        break;
    }
  }

  return 0;
}

auto main(int argc, char *argv[]) -> int
{
  auto conf = parse_args(argc, argv, std::cout, std::cerr);
  if (!conf)
  {
    auto args = std::span(argv, argc).subspan(1);
    auto help = std::ranges::any_of(args, [](std::string_view arg) {
      return arg == "-h" || arg == "--help";
    });
    return help ? 0 : 1;
  }

  // SPDLOG_LEVEL overrides the command line.
  spdlog::cfg::load_env_levels();

  // Every thread started from here on inherits the blocked mask, so the
  // signals are only ever consumed by sigtimedwait.
  pthread_sigmask(SIG_BLOCK, signal_mask(), nullptr);

  auto err = std::error_code();
  auto rt = runtime(*conf, err);
  if (err)
  {
    std::cerr << std::format("Unable to open root directory {}: {}\n",
                             conf->root.string(), err.message());
    return 1;
  }

  spdlog::info("Serving artifacts from {}.", rt.store.root().string());

  auto server = supervisor(rt);
  server.start(err);
  if (err)
  {
    spdlog::critical("Unable to start: {}.", err.message());
    server.shutdown();
    return 1;
  }

  if (auto signum = wait_for_shutdown(server))
    spdlog::info("Received {}.", strsignal(signum));

  server.shutdown();
  return 0;
}
