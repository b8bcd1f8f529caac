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
 * @file config.cpp
 * @brief This file implements command-line configuration parsing.
 */
#include "netboot/config.hpp"
#include "netboot/detail/argument_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <limits>
namespace netboot {

static constexpr char const *const usage =
    "usage: {} [-r <ROOT>] [-a <ADDRESS>] [-p <PORT>] [-P <PORT>] [OPTIONS]\n"
    "\n"
    "Options:\n"
    "-h, --help                  print this help.\n"
    "-r, --root-dir=<ROOT>       directory to serve artifacts from (default: "
    ".).\n"
    "-a, --address=<ADDRESS>     address to bind both listeners to (default: "
    "0.0.0.0).\n"
    "-p, --tftp-port=<PORT>      TFTP port to listen on (default: 69).\n"
    "-P, --http-port=<PORT>      HTTP port to listen on (default: 8080).\n"
    "    --no-tftp               disable the TFTP listener.\n"
    "    --no-http               disable the HTTP listener.\n"
    "    --blksize-min=<BYTES>   smallest negotiable TFTP block size "
    "(default: 8).\n"
    "    --blksize-max=<BYTES>   largest negotiable TFTP block size "
    "(default: 65464).\n"
    "    --max-sessions=<N>      concurrent TFTP session limit (default: "
    "64).\n"
    "    --timeout=<SECONDS>     TFTP retransmission interval (default: 1).\n"
    "    --retries=<N>           TFTP retransmission budget (default: 5).\n"
    "    --idle-timeout=<SECONDS> idle TFTP session bound (default: 30).\n"
    "    --http-timeout=<SECONDS> HTTP request timeout (default: 30).\n"
    "    --grace=<SECONDS>       shutdown grace period (default: 5).\n"
    "-l, --log-level=<LEVEL>     set the log-level (critical, error, warn, "
    "info, debug, trace, off).\n";

/** @brief Parses an unsigned integer in [lo, hi]. */
template <typename T>
static auto to_number(std::string_view value, T &result, T lo = 0,
                      T hi = std::numeric_limits<T>::max()) -> bool
{
  auto number = T{};
  const auto *end = value.data() + value.size();
  auto [ptr, err] = std::from_chars(value.data(), end, number);
  if (value.empty() || err != std::errc{} || ptr != end)
    return false;

  if (number < lo || number > hi)
    return false;

  result = number;
  return true;
}

/** @brief Parses a positive number of seconds. */
static auto to_seconds(std::string_view value,
                       std::chrono::seconds &result) -> bool
{
  auto count = unsigned{};
  if (!to_number(value, count, 1U))
    return false;

  result = std::chrono::seconds(count);
  return true;
}

auto set_loglevel(std::string_view value, std::ostream &err) -> int
{
  auto level = std::string(value);
  std::ranges::transform(level, level.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });

  auto spdlog_level = spdlog::level::from_str(level);
  if (spdlog_level != spdlog::level::off || level == "off")
  {
    spdlog::set_level(spdlog_level);
    return 0;
  }

  err << std::format("Unrecognized log level: {}\n", value)
      << "Valid log levels are: ";

  int count = 0;
  for (const auto &level_str : spdlog::level::level_string_views)
  {
    if (count++ > 0)
      err << ", ";

    err << std::string(level_str.begin(), level_str.end());
  }
  err << "\n";
  return -1;
}

/** @brief Cross-field checks that cannot be done per flag. */
static auto validate(const config &conf, std::ostream &err) -> bool
{
  auto ec = std::error_code();
  if (!std::filesystem::is_directory(conf.root, ec))
  {
    err << std::format("Root directory does not exist: {}\n",
                       conf.root.string());
    return false;
  }

  if (conf.blksize_min > conf.blksize_max)
  {
    err << std::format("--blksize-min ({}) is larger than --blksize-max "
                       "({}).\n",
                       conf.blksize_min, conf.blksize_max);
    return false;
  }

  if (!conf.enable_tftp && !conf.enable_http)
  {
    err << "--no-tftp and --no-http leave nothing to serve.\n";
    return false;
  }

  return true;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
auto parse_args(int argc, char const *const *argv, std::ostream &out,
                std::ostream &err) -> std::optional<config>
{
  using namespace netboot::detail;

  auto conf = config();
  auto progname = std::filesystem::path(*argv).stem();

  auto error = [&]() -> std::optional<config> {
    err << std::format(usage, progname.c_str());
    return std::nullopt;
  };

  auto invalid = [&](std::string_view flag,
                     std::string_view value) -> std::optional<config> {
    err << std::format("Invalid value for {}: {}\n", flag, value);
    return error();
  };

  for (const auto &[flag, value] : argument_parser::parse(argc, argv))
  {
    if (flag.empty())
    {
      err << std::format("Unexpected argument: {}\n", value);
      return error();
    }

    if (flag == "-h" || flag == "--help")
    {
      out << std::format(usage, progname.c_str());
      return std::nullopt;
    }

    if (flag == "--no-tftp" || flag == "--no-http")
    {
      if (!value.empty())
        return invalid(flag, value);

      (flag == "--no-tftp" ? conf.enable_tftp : conf.enable_http) = false;
    }
    else if (flag == "-r" || flag == "--root-dir")
    {
      if (value.empty())
        return invalid(flag, value);

      conf.root = std::filesystem::path(value);
    }
    else if (flag == "-a" || flag == "--address")
    {
      if (value.empty())
        return invalid(flag, value);

      conf.address = std::string(value);
    }
    else if (flag == "-p" || flag == "--tftp-port")
    {
      if (!to_number(value, conf.tftp_port))
        return invalid(flag, value);
    }
    else if (flag == "-P" || flag == "--http-port")
    {
      if (!to_number(value, conf.http_port))
        return invalid(flag, value);
    }
    else if (flag == "--blksize-min")
    {
      if (!to_number(value, conf.blksize_min, config::BLKSIZE_MIN,
                     config::BLKSIZE_MAX))
        return invalid(flag, value);
    }
    else if (flag == "--blksize-max")
    {
      if (!to_number(value, conf.blksize_max, config::BLKSIZE_MIN,
                     config::BLKSIZE_MAX))
        return invalid(flag, value);
    }
    else if (flag == "--max-sessions")
    {
      if (!to_number(value, conf.max_sessions, std::size_t{1}))
        return invalid(flag, value);
    }
    else if (flag == "--timeout")
    {
      if (!to_seconds(value, conf.timeout))
        return invalid(flag, value);
    }
    else if (flag == "--retries")
    {
      if (!to_number(value, conf.retries, 1U))
        return invalid(flag, value);
    }
    else if (flag == "--idle-timeout")
    {
      if (!to_seconds(value, conf.idle_timeout))
        return invalid(flag, value);
    }
    else if (flag == "--http-timeout")
    {
      if (!to_seconds(value, conf.http_timeout))
        return invalid(flag, value);
    }
    else if (flag == "--grace")
    {
      if (!to_seconds(value, conf.grace))
        return invalid(flag, value);
    }
    else if (flag == "-l" || flag == "--log-level")
    {
      if (set_loglevel(value, err))
        return error();
    }
    else
    {
      err << std::format("Unknown flag: {}\n", flag);
      return error();
    }
  }

  if (!validate(conf, err))
    return error();

  return {conf};
}
} // namespace netboot
