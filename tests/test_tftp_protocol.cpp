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
// NOLINTBEGIN
#include "netboot/protocol/tftp_protocol.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string>

using namespace netboot::tftp;
using enum messages::opcode_t;
using enum messages::mode_t;
using enum messages::error_t;

/** Builds a request datagram from NUL separated fields. */
static auto datagram(std::uint16_t opc, std::string_view fields)
    -> std::vector<std::byte>
{
  auto buf = std::vector<std::byte>(2 + fields.size());
  buf[0] = static_cast<std::byte>(opc >> 8);
  buf[1] = static_cast<std::byte>(opc & 0xFF);
  std::memcpy(buf.data() + 2, fields.data(), fields.size());
  return buf;
}

TEST(TftpProtocolTest, ErrorMessageLayout)
{
  constexpr auto msg = errors::msg(FILE_NOT_FOUND, "File not found.");
  static_assert(msg.size() == 4 + sizeof("File not found."));

  EXPECT_EQ(msg[0], 0);
  EXPECT_EQ(msg[1], ERROR);
  EXPECT_EQ(msg[2], 0);
  EXPECT_EQ(msg[3], FILE_NOT_FOUND);
  EXPECT_EQ(std::string_view(msg.data() + 4), "File not found.");
  EXPECT_EQ(msg.back(), '\0');
}

TEST(TftpProtocolTest, WireCodes)
{
  EXPECT_EQ(errors::code(ACCESS_VIOLATION), ACCESS_VIOLATION);
  EXPECT_EQ(errors::code(OPTION_NEGOTIATION), OPTION_NEGOTIATION);
  EXPECT_EQ(errors::code(SERVER_BUSY), DISK_FULL);
  EXPECT_EQ(errors::code(ALREADY_IN_USE), NOT_DEFINED);
  EXPECT_EQ(errors::code(SHUTTING_DOWN), NOT_DEFINED);
  EXPECT_EQ(errors::code(IO_ERROR), NOT_DEFINED);
  EXPECT_EQ(errors::code(TIMED_OUT), NOT_DEFINED);
}

TEST(TftpProtocolTest, PacketsCarryWireCodes)
{
  for (auto error : {FILE_NOT_FOUND, ACCESS_VIOLATION, ILLEGAL_OPERATION,
                     UNKNOWN_TID, IO_ERROR, ALREADY_IN_USE, SERVER_BUSY,
                     SHUTTING_DOWN})
  {
    auto packet = errors::packet(error);
    ASSERT_GT(packet.size(), 4U) << errors::errstr(error);
    EXPECT_EQ(packet[1], ERROR);
    EXPECT_EQ(static_cast<std::uint8_t>(packet[3]), errors::code(error));
    EXPECT_EQ(std::string_view(packet.data() + 4), errors::errstr(error));
  }

  EXPECT_TRUE(errors::packet(TIMED_OUT).empty());
  EXPECT_TRUE(errors::packet(NOT_DEFINED).empty());
}

TEST(TftpProtocolTest, ServerConditionsUseStandardCodes)
{
  // Busy goes out as disk full, the rest as not defined.
  EXPECT_EQ(errors::server_busy()[3], 3);
  EXPECT_EQ(errors::already_in_use()[3], 0);
  EXPECT_EQ(errors::shutting_down()[3], 0);
  EXPECT_EQ(errors::io_error()[3], 0);
}

TEST(TftpProtocolTest, ToMode)
{
  EXPECT_EQ(to_mode("octet"), OCTET);
  EXPECT_EQ(to_mode("OCTET"), OCTET);
  EXPECT_EQ(to_mode("binary"), OCTET);
  EXPECT_EQ(to_mode("NetAscii"), NETASCII);
  EXPECT_EQ(to_mode("mail"), MAIL);
  EXPECT_EQ(to_mode("octets"), 0);
  EXPECT_EQ(to_mode(""), 0);
}

TEST(TftpProtocolTest, ParsePlainRRQ)
{
  using namespace std::string_view_literals;
  auto buf = datagram(RRQ, "pxelinux.0\0octet\0"sv);
  auto req = parse_request(buf);

  EXPECT_EQ(req.opc, RRQ);
  EXPECT_EQ(req.mode, OCTET);
  EXPECT_EQ(req.filename, "pxelinux.0");
  EXPECT_TRUE(req.options.empty());
}

TEST(TftpProtocolTest, ParseRRQWithOptions)
{
  using namespace std::string_view_literals;
  auto buf = datagram(
      RRQ, "images/vmlinuz\0Octet\0blksize\0001468\0tsize\0000\0"sv);
  auto req = parse_request(buf);

  EXPECT_EQ(req.opc, RRQ);
  EXPECT_EQ(req.mode, OCTET);
  EXPECT_EQ(req.filename, "images/vmlinuz");
  ASSERT_EQ(req.options.size(), 2U);
  EXPECT_EQ(req.options[0].first, "blksize");
  EXPECT_EQ(req.options[0].second, "1468");
  EXPECT_EQ(req.options[1].first, "tsize");
  EXPECT_EQ(req.options[1].second, "0");
}

TEST(TftpProtocolTest, ParseWRQ)
{
  using namespace std::string_view_literals;
  auto buf = datagram(WRQ, "upload.bin\0octet\0"sv);
  auto req = parse_request(buf);
  EXPECT_EQ(req.opc, WRQ);
  EXPECT_EQ(req.filename, "upload.bin");
}

TEST(TftpProtocolTest, UnknownModeIsZero)
{
  using namespace std::string_view_literals;
  auto req = parse_request(datagram(RRQ, "pxelinux.0\0ebcdic\0"sv));
  EXPECT_EQ(req.opc, RRQ);
  EXPECT_EQ(req.mode, 0);
}

TEST(TftpProtocolTest, MalformedRequests)
{
  using namespace std::string_view_literals;

  // Too short for an opcode.
  auto tiny = std::vector<std::byte>{std::byte{0}};
  EXPECT_EQ(parse_request(tiny).opc, 0);

  // Missing mode terminator.
  EXPECT_EQ(parse_request(datagram(RRQ, "pxelinux.0\0octet"sv)).opc, 0);

  // Missing filename terminator.
  EXPECT_EQ(parse_request(datagram(RRQ, "pxelinux.0"sv)).opc, 0);

  // Empty filename.
  EXPECT_EQ(parse_request(datagram(RRQ, "\0octet\0"sv)).opc, 0);

  // Option without a value.
  EXPECT_EQ(parse_request(datagram(RRQ, "a\0octet\0blksize\0"sv)).opc, 0);

  // Option value without a terminator.
  EXPECT_EQ(parse_request(datagram(RRQ, "a\0octet\0blksize\0001024"sv)).opc,
            0);
}

// NOLINTEND
