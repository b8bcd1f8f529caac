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
 * @file tftp_protocol.cpp
 * @brief This file defines TFTP message parsing.
 */
#include "netboot/protocol/tftp_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
namespace netboot::tftp {

auto errors::packet(std::uint16_t error) noexcept -> std::span<const char>
{
  using enum messages::error_t;
  switch (error)
  {
    case ACCESS_VIOLATION:
      return access_violation();

    case FILE_NOT_FOUND:
      return file_not_found();

    case ILLEGAL_OPERATION:
      return illegal_operation();

    case UNKNOWN_TID:
      return unknown_tid();

    case IO_ERROR:
      return io_error();

    case ALREADY_IN_USE:
      return already_in_use();

    case SERVER_BUSY:
      return server_busy();

    case SHUTTING_DOWN:
      return shutting_down();

    default:
      return {};
  }
}

/**
 * @brief Reads the NUL terminated field starting at pos.
 * @returns The field, or std::nullopt if the terminator is missing.
 */
static auto next_field(const char *&pos, const char *end) noexcept
    -> std::optional<std::string_view>
{
  const auto *found = std::find(pos, end, '\0');
  if (found == end)
    return std::nullopt;

  auto field = std::string_view(pos, found);
  pos = found + 1;
  return field;
}

/** @brief Case-insensitive string comparison. */
static auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool
{
  return std::ranges::equal(lhs, rhs, [](unsigned char lhs, unsigned char rhs) {
    return std::tolower(lhs) == std::tolower(rhs);
  });
}

auto to_mode(std::string_view mode) noexcept -> std::uint8_t
{
  using enum messages::mode_t;

  if (iequals(mode, "octet") || iequals(mode, "binary"))
    return OCTET;

  if (iequals(mode, "netascii"))
    return NETASCII;

  if (iequals(mode, "mail"))
    return MAIL;

  return 0;
}

auto parse_request(std::span<const std::byte> msg) -> messages::request
{
  auto req = messages::request{};
  if (msg.size() < sizeof(messages::opcode_t))
    return req;

  // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto *pos = reinterpret_cast<const char *>(msg.data());
  const auto *end = pos + msg.size();
  // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)

  auto opc = static_cast<std::uint16_t>(
      (std::to_integer<std::uint16_t>(msg[0]) << 8U) |
      std::to_integer<std::uint16_t>(msg[1]));
  pos += sizeof(messages::opcode_t);

  auto filename = next_field(pos, end);
  if (!filename || filename->empty())
    return req;

  auto mode = next_field(pos, end);
  if (!mode)
    return req;

  while (pos != end)
  {
    auto name = next_field(pos, end);
    if (!name)
      return req;

    auto value = next_field(pos, end);
    if (!value)
      return req;

    req.options.emplace_back(*name, *value);
  }

  req.opc = opc;
  req.filename = *filename;
  req.mode = to_mode(*mode);
  return req;
}
} // namespace netboot::tftp
