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
#pragma once
#ifndef NETBOOT_TEST_SERVER_FIXTURE_HPP
#define NETBOOT_TEST_SERVER_FIXTURE_HPP
#include "netboot/protocol/tftp_protocol.hpp"
#include "netboot/runtime.hpp"
#include "netboot/tftp_server.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

using namespace netboot;
using namespace netboot::tftp;

static inline auto test_counter = std::atomic<std::uint16_t>();
class TftpServerTests : public ::testing::Test {
protected:
  using tftp_server = net::service::context_thread<server>;
  static constexpr std::uint16_t TFTP_PORT = 6969;

  auto SetUp() noexcept -> void override
  {
    using enum net::service::async_context::context_states;

    root = std::filesystem::temp_directory_path() /
           std::format("netboot-tftp.{:05d}", test_counter++);
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);

    addr_v4->sin_family = AF_INET;
    addr_v4->sin_port = htons(TFTP_PORT);

    auto conf = config{};
    conf.root = root;
    conf.address = "127.0.0.1";
    conf.tftp_port = TFTP_PORT;
    conf.max_sessions = 4;
    conf.retries = 2;
    configure(conf);

    auto err = std::error_code();
    rt_ = std::make_unique<runtime>(conf, err);
    ASSERT_FALSE(err);

    server_ = std::make_unique<tftp_server>();
    server_->start(addr_v4, std::ref(*rt_));
    server_->state.wait(PENDING);
    ASSERT_EQ(server_->state, STARTED);

    addr_v4->sin_addr.s_addr = inet_addr("127.0.0.1");
  }

  auto TearDown() noexcept -> void override
  {
    using enum net::service::async_context::context_states;

    server_->signal(server_->terminate);
    server_->state.wait(STARTED);
    ASSERT_EQ(server_->state, STOPPED);
    server_.reset();
    rt_.reset();

    std::filesystem::remove_all(root);
  }

  /** Adjusts the server configuration before it starts. */
  virtual auto configure(config &conf) -> void {}

  /** Writes a file whose byte i is (i % 251) under the root. */
  auto create_file(const std::string &name, std::size_t size) -> std::string
  {
    auto content = std::string(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
      content[i] = static_cast<char>(i % 251);

    auto file = std::ofstream(root / name, std::ios::binary);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return content;
  }

  /** Builds an RRQ or WRQ with optional RFC 2347 options. */
  static auto request(std::uint16_t opc, std::string_view filename,
                      std::string_view mode = "octet",
                      std::vector<messages::option> options = {})
      -> std::vector<char>
  {
    auto buf = std::vector<char>(sizeof(messages::opcode_t));
    auto netopc = htons(opc);
    std::memcpy(buf.data(), &netopc, sizeof(netopc));

    auto field = [&](std::string_view str) {
      buf.insert(buf.end(), str.begin(), str.end());
      buf.push_back('\0');
    };

    field(filename);
    field(mode);
    for (const auto &[name, value] : options)
    {
      field(name);
      field(value);
    }
    return buf;
  }

  static auto ack_for(std::uint16_t block) -> std::vector<char>
  {
    auto buf = std::vector<char>(sizeof(messages::ack));
    auto *msg = reinterpret_cast<messages::ack *>(buf.data());
    msg->opc = htons(messages::ACK);
    msg->block_num = htons(block);
    return buf;
  }

  using message = io::socket::socket_message<sockaddr_in6>;

  /** Sends a datagram to the listening port. */
  auto to_server(io::socket::socket_handle &sock, std::vector<char> &buf)
  {
    return io::sendmsg(
        sock, io::socket::socket_message{.address = {addr_v4}, .buffers = buf},
        0);
  }

  /** Sends a datagram back to whoever sent from. */
  static auto reply(io::socket::socket_handle &sock, const message &from,
                    std::vector<char> &buf)
  {
    return io::sendmsg(
        sock,
        io::socket::socket_message{.address = from.address, .buffers = buf},
        0);
  }

  static auto inbox(std::vector<char> &buf) -> message
  {
    return message{.address = {io::socket::socket_address<sockaddr_in6>()},
                   .buffers = buf};
  }

  /** True if the first len bytes of buf are exactly packet. */
  static auto matches(const std::vector<char> &buf, std::ptrdiff_t len,
                      std::span<const char> packet) -> bool
  {
    return len == std::ssize(packet) &&
           std::memcmp(buf.data(), packet.data(), packet.size()) == 0;
  }

  static auto opcode_of(const std::vector<char> &buf) -> std::uint16_t
  {
    return ntohs(reinterpret_cast<const messages::data *>(buf.data())->opc);
  }

  static auto block_of(const std::vector<char> &buf) -> std::uint16_t
  {
    return ntohs(
        reinterpret_cast<const messages::data *>(buf.data())->block_num);
  }

  /** Opens a client socket that gives up on reads after five seconds. */
  auto client() -> io::socket::socket_handle
  {
    auto sock = io::socket::socket_handle(AF_INET, SOCK_DGRAM, 0);
    auto timeout = timeval{.tv_sec = 5, .tv_usec = 0};
    setsockopt(static_cast<io::socket::native_socket_type>(sock), SOL_SOCKET,
               SO_RCVTIMEO, &timeout, sizeof(timeout));
    return sock;
  }

  /** Waits up to five seconds for the session table to empty. */
  auto wait_for_no_sessions() -> bool
  {
    using namespace std::chrono;
    auto deadline = steady_clock::now() + 5s;
    while (rt_->sessions.size() > 0)
    {
      if (steady_clock::now() > deadline)
        return false;
      std::this_thread::sleep_for(10ms);
    }
    return true;
  }

  std::filesystem::path root;
  io::socket::socket_address<sockaddr_in> addr_v4;
  std::unique_ptr<runtime> rt_;
  std::unique_ptr<tftp_server> server_;
};

class TftpServerIdleTests : public TftpServerTests {
protected:
  // Retransmission alone would keep a silent session alive for 10s.
  auto configure(config &conf) -> void override
  {
    conf.retries = 10;
    conf.idle_timeout = std::chrono::seconds(1);
  }
};

class TftpServerRRQOctetTests
    : public TftpServerTests,
      public ::testing::WithParamInterface<std::size_t> {};

class TftpServerRRQBlksizeTests
    : public TftpServerTests,
      public ::testing::WithParamInterface<std::pair<std::size_t, std::size_t>> {
};
#endif // NETBOOT_TEST_SERVER_FIXTURE_HPP
// NOLINTEND
