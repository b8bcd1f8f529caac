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
 * @file socket_address.cpp
 * @brief This file defines socket address helpers shared by both listeners.
 */
#include "netboot/detail/socket_address.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <string>

#include <arpa/inet.h>
namespace netboot::detail {
/** @brief Bounds checked implementation of strlen. */
[[nodiscard]] static constexpr auto
strnlen(const char *str, std::size_t maxlen) noexcept -> std::size_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *found = std::find(str, str + maxlen, '\0');
  return found - str;
}

auto to_str(std::span<char> buf, socket_address<sockaddr_in6> addr) noexcept
    -> std::string_view
{
  if (buf.size() < ADDRSTR_LEN) [[unlikely]]
    return {};

  std::memset(buf.data(), 0, buf.size());
  unsigned short port = 0;
  std::size_t len = 0;

  if (addr->sin6_family == AF_INET)
  {
    const auto *addr_v4 =
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<const sockaddr_in *>(std::ranges::data(addr));
    inet_ntop(AF_INET, &addr_v4->sin_addr, buf.data(), buf.size());
    port = ntohs(addr_v4->sin_port);
    len = strnlen(buf.data(), buf.size());
  }
  else if (IN6_IS_ADDR_V4MAPPED(&addr->sin6_addr))
  {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    inet_ntop(AF_INET, &addr->sin6_addr.s6_addr[12], buf.data(), buf.size());
    port = ntohs(addr->sin6_port);
    len = strnlen(buf.data(), buf.size());
  }
  else
  {
    buf[0] = '[';
    inet_ntop(AF_INET6, &addr->sin6_addr, buf.data() + 1, buf.size() - 1);
    port = ntohs(addr->sin6_port);
    len = strnlen(buf.data(), buf.size());
    buf[len++] = ']';
  }

  buf[len++] = ':';
  auto [ptr, err] = std::to_chars(buf.data() + len, buf.data() + buf.size(),
                                  port);
  return {buf.data(), ptr};
}

auto make_address(std::string_view host, std::uint16_t port,
                  std::error_code &err) -> socket_address<sockaddr_in6>
{
  auto address = socket_address<sockaddr_in6>{};
  address->sin6_family = AF_INET6;
  address->sin6_port = htons(port);
  err.clear();

  auto str = std::string(host);
  if (inet_pton(AF_INET6, str.c_str(), &address->sin6_addr) == 1)
    return address;

  auto addr_v4 = in_addr{};
  if (inet_pton(AF_INET, str.c_str(), &addr_v4) != 1)
  {
    err = std::make_error_code(std::errc::invalid_argument);
    return address;
  }

  if (addr_v4.s_addr == htonl(INADDR_ANY))
  {
    address->sin6_addr = in6addr_any;
    return address;
  }

  // ::ffff:a.b.c.d
  constexpr auto MAPPED_PREFIX = 10;
  std::memset(&address->sin6_addr, 0, sizeof(address->sin6_addr));
  address->sin6_addr.s6_addr[MAPPED_PREFIX] = 0xff;
  address->sin6_addr.s6_addr[MAPPED_PREFIX + 1] = 0xff;
  std::memcpy(&address->sin6_addr.s6_addr[MAPPED_PREFIX + 2], &addr_v4,
              sizeof(addr_v4));
  return address;
}

auto to_key(socket_address<sockaddr_in6> addr) noexcept
    -> socket_address<sockaddr_in6>
{
  auto key = addr;
  if (key->sin6_family == AF_INET)
  {
    key = io::socket::socket_address(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<sockaddr_in *>(std::ranges::data(key)));
  }

  return key;
}
} // namespace netboot::detail
