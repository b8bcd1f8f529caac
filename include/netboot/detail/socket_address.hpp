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
 * @file socket_address.hpp
 * @brief This file declares socket address helpers shared by both listeners.
 */
#pragma once
#ifndef NETBOOT_SOCKET_ADDRESS_HPP
#define NETBOOT_SOCKET_ADDRESS_HPP
#include <net/cppnet.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>

#include <netinet/in.h>
namespace netboot::detail {
/** @brief Socket address type. */
template <typename T> using socket_address = ::io::socket::socket_address<T>;

/** @brief Additional buffer length for <PORT>,[],: and null.  */
static constexpr auto ADDR_BUFLEN = 9UL;
/** @brief A buffer large enough to print any address and port. */
static constexpr auto ADDRSTR_LEN = INET6_ADDRSTRLEN + ADDR_BUFLEN;

/**
 * @brief Converts the socket address to a string inside buf.
 * @details IPv4-mapped IPv6 addresses are printed in dotted form, other IPv6
 * addresses in brackets.
 * @param buf A buffer of at least ADDRSTR_LEN bytes.
 * @param addr The address to print.
 * @returns A view of the printed address, empty if buf is too small.
 */
[[nodiscard]] auto to_str(std::span<char> buf,
                          socket_address<sockaddr_in6> addr) noexcept
    -> std::string_view;

/**
 * @brief Builds a listening address from a host literal and port.
 * @details IPv4 literals are mapped into IPv6 so that a single dual-stack
 * socket serves both families; 0.0.0.0 maps to the IPv6 wildcard.
 * @param host An IPv4 or IPv6 address literal.
 * @param port The port in host byte order.
 * @param[out] err Set to std::errc::invalid_argument if host is not an
 * address literal.
 * @returns The address.
 */
[[nodiscard]] auto make_address(std::string_view host, std::uint16_t port,
                                std::error_code &err)
    -> socket_address<sockaddr_in6>;

/**
 * @brief Normalizes a peer address for use as a session key.
 * @details Addresses read off an IPv4 socket are rebuilt as IPv4 addresses
 * so that the address length and padding match for every datagram from the
 * same client.
 * @param addr The peer address.
 * @returns The normalized address.
 */
[[nodiscard]] auto to_key(socket_address<sockaddr_in6> addr) noexcept
    -> socket_address<sockaddr_in6>;
} // namespace netboot::detail
#endif // NETBOOT_SOCKET_ADDRESS_HPP
