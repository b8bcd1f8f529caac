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
 * @file http_server.cpp
 * @brief This file defines the HTTP server.
 */
#include "netboot/http_server.hpp"
#include "netboot/detail/socket_address.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

#include <sys/socket.h>
namespace netboot::http {
/** @brief Prints the peer address of a connected socket. */
static auto peer_of(io::socket::native_socket_type sock) -> std::string
{
  auto addr = detail::socket_address<sockaddr_in6>{};
  auto len = socklen_t{sizeof(sockaddr_in6)};

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  auto *ptr = reinterpret_cast<sockaddr *>(std::ranges::data(addr));
  if (getpeername(sock, ptr, &len) != 0) [[unlikely]]
    return "-";

  auto buf = std::array<char, detail::ADDRSTR_LEN>{};
  return std::string(detail::to_str(buf, addr));
}

auto server::close(async_context &ctx, const socket_dialog &socket) -> void
{
  auto sock = static_cast<socket_type>(*socket.socket);
  if (auto it = connections_.find(sock); it != connections_.end())
  {
    auto &conn = it->second;
    conn.timer = ctx.timers.remove(conn.timer);
    if (conn.status != 0)
      --rt_.http_inflight;

    connections_.erase(it);
  }

  io::shutdown(socket, SHUT_RDWR);
}

auto server::write(async_context &ctx, const socket_dialog &socket) -> void
{
  using namespace stdexec;

  auto sock = static_cast<socket_type>(*socket.socket);
  auto it = connections_.find(sock);
  if (it == connections_.end())
    return;

  auto &conn = it->second;
  if (conn.sent == conn.out.size())
  {
    if (!conn.stream || conn.stream->remaining() == 0)
    {
      spdlog::info("HTTP:{}:\"{}\" {}", conn.peer, conn.request_line,
                   conn.status);
      return close(ctx, socket);
    }

    conn.out.resize(static_cast<std::size_t>(
        std::min<std::uintmax_t>(CHUNK_SIZE, conn.stream->remaining())));

    auto err = std::error_code();
    auto len = conn.stream->read(conn.out, err);
    if (err)
    {
      // The head has gone out already, all that is left is to hang up.
      spdlog::error("HTTP:{}:\"{}\" {} aborted: {}", conn.peer,
                    conn.request_line, conn.status, err.message());
      return close(ctx, socket);
    }

    conn.out.resize(len);
    conn.sent = 0;
  }

  auto buf = std::span(conn.out).subspan(conn.sent);
  sender auto sendmsg =
      io::sendmsg(socket, socket_message{.buffers = buf}, MSG_NOSIGNAL) |
      then([&, socket, sock](auto &&len) {
        auto it = connections_.find(sock);
        if (it == connections_.end())
          return;

        auto dialog = socket;
        if (static_cast<std::ptrdiff_t>(len) <= 0) [[unlikely]]
          return close(ctx, dialog); // GCOVR_EXCL_LINE

        it->second.sent += static_cast<std::size_t>(len);
        write(ctx, dialog);
      }) |
      upon_error([&, socket](auto &&) {
        auto dialog = socket;
        spdlog::debug("HTTP:Connection reset by peer.");
        close(ctx, dialog);
      });

  ctx.scope.spawn(std::move(sendmsg));
}

auto server::respond(async_context &ctx, const socket_dialog &socket,
                     connection &conn, response res, bool head_only) -> void
{
  conn.timer = ctx.timers.remove(conn.timer);
  conn.status = res.status;
  ++rt_.http_inflight;

  auto head = to_string(res, artifact::clock::now(), head_only);
  conn.out.assign(head.begin(), head.end());
  conn.sent = 0;
  if (!head_only)
    conn.stream = std::move(res.stream);

  write(ctx, socket);
}

auto server::operator()(async_context &ctx, const socket_dialog &socket,
                        const std::shared_ptr<read_context> &rctx,
                        std::span<const std::byte> buf) -> void
{
  if (!rctx)
    return;

  // End of stream.
  if (buf.empty())
    return close(ctx, socket);

  auto sock = static_cast<socket_type>(*socket.socket);
  auto [it, created] = connections_.try_emplace(sock);
  auto &conn = it->second;
  if (created)
  {
    conn.peer = peer_of(sock);
    if (rt_.draining)
    {
      spdlog::debug("HTTP:{}:Refused, server shutting down.", conn.peer);
      return close(ctx, socket);
    }

    conn.timer = ctx.timers.add(
        rt_.conf.http_timeout, [&, socket, peer = conn.peer](auto) {
          auto dialog = socket;
          spdlog::warn("HTTP:{}:Request timed out.", peer);
          close(ctx, dialog);
        });
  }

  // One request per connection, anything after it is ignored.
  if (conn.status != 0)
    return;

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  conn.head.append(reinterpret_cast<const char *>(buf.data()), buf.size());

  auto len = head_length(conn.head);
  if (len == std::string_view::npos)
  {
    if (conn.head.size() > MAX_HEAD)
      return respond(ctx, socket, conn, make_error(BAD_REQUEST), false);

    return reader(ctx, socket, rctx);
  }

  auto head = std::string_view(conn.head).substr(0, len);
  conn.request_line = head.substr(0, head.find_first_of("\r\n"));

  auto req = request{};
  if (len > MAX_HEAD || !parse_request(head, req))
  {
    spdlog::debug("HTTP:{}:Malformed request.", conn.peer);
    return respond(ctx, socket, conn, make_error(BAD_REQUEST), false);
  }

  respond(ctx, socket, conn, handle_request(req, rt_.store),
          req.method == "HEAD");
}
} // namespace netboot::http
