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
 * @file tftp_server.cpp
 * @brief TFTP listener and transfer socket handling.
 */
#include "netboot/tftp_server.hpp"
#include "netboot/detail/socket_address.hpp"

#include <net/timers/timers.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <tuple>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>
namespace netboot::tftp {
/** @brief The printed address buffer. */
using addrbuf_t = std::array<char, detail::ADDRSTR_LEN>;

auto server::send(async_context &ctx, const socket_dialog &socket,
                  const key_type &key, std::span<const char> buf,
                  std::shared_ptr<const void> owner) -> void
{
  using namespace stdexec;

  sender auto sendmsg =
      io::sendmsg(socket, socket_message{.address = {key}, .buffers = buf},
                  0) |
      then([owner = std::move(owner)](auto &&) {}) |
      upon_error([](auto &&) {
        spdlog::debug("TFTP:Failed to send datagram."); // GCOVR_EXCL_LINE
      });

  ctx.scope.spawn(std::move(sendmsg));
}

auto server::error(async_context &ctx, const socket_dialog &socket,
                   const key_type &key, const session_ptr &sess,
                   std::uint16_t error) -> void
{
  sess->state.status = session::ERRORED;
  if (auto packet = errors::packet(error); !packet.empty())
    send(ctx, socket, key, packet);

  cleanup(ctx, socket, key, sess);
}

auto server::cleanup(async_context &ctx, const socket_dialog &socket,
                     const key_type &key, const session_ptr &sess) -> void
{
  auto &state = sess->state;

  // No retransmission may fire after this.
  state.timer = ctx.timers.remove(state.timer);

  // Release the artifact.
  state.file.reset();

  // A pending read on the transfer socket completes with an error and the
  // reader is not re-armed.
  io::shutdown(socket, SHUT_RD);

  // The idle sweep may already have taken the session out of the table.
  if (rt_.sessions.lookup(key) == sess)
    rt_.sessions.remove(key);

  transfers_.erase(state.socket);
  if (transfers_.empty())
    sweeper_ = ctx.timers.remove(sweeper_);
}

auto server::retransmit(async_context &ctx, const socket_dialog &socket,
                        const key_type &key, const session_ptr &sess) -> void
{
  auto &state = sess->state;
  state.timer = ctx.timers.remove(state.timer);
  state.timer = ctx.timers.add(
      state.timeout,
      [&, socket, key, sess](auto timer_id) {
        if (auto err = handle_timeout(*sess, rt_.conf.retries))
        {
          auto addrbuf = addrbuf_t{};
          spdlog::warn("RRQ:{}:{} Transfer of {} abandoned at block {}.",
                       detail::to_str(addrbuf, key), errors::errstr(err),
                       sess->state.target.logical_path, sess->state.block_num);

          // Removing the timer releases this closure, so work on copies.
          auto [dialog, peer, self] = std::tuple(socket, key, sess);
          return error(ctx, dialog, peer, self, err);
        }

        send(ctx, socket, key, sess->state.buffer, sess);
      },
      state.timeout);
}

auto server::sweep(async_context &ctx) -> void
{
  if (sweeper_ != session::INVALID_TIMER)
    return;

  const auto interval = std::max(rt_.conf.timeout, std::chrono::seconds(1));
  sweeper_ = ctx.timers.add(
      interval,
      [&](auto timer_id) {
        auto now = session::clock::now();
        for (const auto &[key, sess] :
             rt_.sessions.sweep(now, rt_.conf.idle_timeout))
        {
          auto addrbuf = addrbuf_t{};
          spdlog::warn("RRQ:{}:Evicted idle transfer of {}.",
                       detail::to_str(addrbuf, key),
                       sess->state.target.logical_path);

          auto transfer = transfers_.find(sess->state.socket);
          if (transfer == transfers_.end()) [[unlikely]]
            continue; // GCOVR_EXCL_LINE

          auto socket = transfer->second;
          cleanup(ctx, socket, key, sess);
        }
      },
      interval);
}

auto server::ack(async_context &ctx, const socket_dialog &socket,
                 const std::shared_ptr<read_context> &rctx,
                 std::span<const std::byte> msg, const key_type &key,
                 const session_ptr &sess) -> void
{
  auto addrbuf = addrbuf_t{};
  auto &state = sess->state;

  // A short ACK is malformed and leaves the session alone.
  if (msg.size() < sizeof(messages::ack))
    return reader(ctx, socket, rctx);

  state.last_activity = session::clock::now();

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto *ack = reinterpret_cast<const messages::ack *>(msg.data());
  auto prev_block = state.block_num;
  if (auto err = handle_ack(*ack, *sess))
  {
    spdlog::error("RRQ:{}:{}", detail::to_str(addrbuf, key),
                  errors::errstr(err));
    return error(ctx, socket, key, sess, err);
  }

  if (state.status == session::COMPLETED)
  {
    spdlog::info("RRQ:{}:Completed {}.", detail::to_str(addrbuf, key),
                 state.target.logical_path);
    return cleanup(ctx, socket, key, sess);
  }

  if (state.block_num != prev_block)
  {
    spdlog::debug("RRQ:{}:DATA {} ({} bytes).", detail::to_str(addrbuf, key),
                  state.block_num,
                  state.buffer.size() - sizeof(messages::data));
    send(ctx, socket, key, state.buffer, sess);
    retransmit(ctx, socket, key, sess);
  }

  reader(ctx, socket, rctx);
}

auto server::service(async_context &ctx, const socket_dialog &socket,
                     const std::shared_ptr<read_context> &rctx,
                     std::span<const std::byte> buf, const key_type &key) -> void
{
  using enum messages::opcode_t;
  auto addrbuf = addrbuf_t{};

  auto sess = rt_.sessions.lookup(key);
  if (!sess ||
      sess->state.socket != static_cast<session::socket_type>(*socket.socket))
  {
    // This transfer socket belongs to some other endpoint.
    spdlog::debug("TFTP:{}:Unknown transfer ID.", detail::to_str(addrbuf, key));
    send(ctx, socket, key, errors::unknown_tid());
    return reader(ctx, socket, rctx);
  }

  if (buf.size() < sizeof(messages::opcode_t))
    return reader(ctx, socket, rctx);

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto *opcode = reinterpret_cast<const std::uint16_t *>(buf.data());
  switch (ntohs(*opcode))
  {
    case ACK:
      return ack(ctx, socket, rctx, buf, key, sess);

    case ERROR:
      spdlog::warn("RRQ:{}:Transfer of {} aborted by client.",
                   detail::to_str(addrbuf, key),
                   sess->state.target.logical_path);
      sess->state.status = session::ERRORED;
      return cleanup(ctx, socket, key, sess);

    default:
      return reader(ctx, socket, rctx);
  }
}

auto server::request(async_context &ctx, const socket_dialog &socket,
                     std::span<const std::byte> buf,
                     const key_type &key) -> void
{
  using enum messages::opcode_t;
  using enum messages::error_t;
  auto addrbuf = addrbuf_t{};
  auto addrstr = detail::to_str(addrbuf, key);

  auto req = parse_request(buf);
  if (req.opc == WRQ)
  {
    spdlog::warn("WRQ:{}:{}", addrstr, errors::errstr(ACCESS_VIOLATION));
    return send(ctx, socket, key, errors::access_violation());
  }

  if (req.opc != RRQ)
  {
    spdlog::debug("TFTP:{}:Dropped malformed datagram.", addrstr);
    return;
  }

  spdlog::info("RRQ:{}:New RRQ for {}.", addrstr, req.filename);
  if (rt_.draining)
  {
    spdlog::warn("RRQ:{}:{}", addrstr, errors::errstr(SHUTTING_DOWN));
    return send(ctx, socket, key, errors::shutting_down());
  }

  if (rt_.sessions.lookup(key))
  {
    spdlog::warn("RRQ:{}:{}", addrstr, errors::errstr(ALREADY_IN_USE));
    return send(ctx, socket, key, errors::already_in_use());
  }

  // Rejected requests never take a slot in the session table.
  auto sess = std::make_shared<session>();
  if (auto error = handle_request(req, rt_.store, rt_.conf, *sess))
  {
    spdlog::error("RRQ:{}:{}", addrstr, errors::errstr(error));
    return send(ctx, socket, key, errors::packet(error));
  }

  auto err = std::error_code();
  if (!rt_.sessions.create_if_absent(key, err, sess))
  {
    auto error =
        (err == std::errc::address_in_use) ? ALREADY_IN_USE : SERVER_BUSY;
    spdlog::warn("RRQ:{}:{}", addrstr, errors::errstr(error));
    return send(ctx, socket, key, errors::packet(error));
  }

  // Bind the TFTP session to a fresh socket, its port is the server TID.
  auto transfer = ctx.poller.emplace(key->sin6_family, SOCK_DGRAM, 0);
  auto &state = sess->state;
  state.socket = static_cast<session::socket_type>(*transfer.socket);
  transfers_.insert_or_assign(state.socket, transfer);

  spdlog::debug("RRQ:{}:blksize={} timeout={}s size={}.", addrstr,
                state.blksize, state.timeout.count(), state.target.size);

  send(ctx, transfer, key, state.buffer, sess);
  retransmit(ctx, transfer, key, sess);
  sweep(ctx);

  reader(ctx, transfer, std::make_shared<read_context>());
}

auto server::operator()(async_context &ctx, const socket_dialog &socket,
                        const std::shared_ptr<read_context> &rctx,
                        std::span<const std::byte> buf) -> void
{
  if (!rctx)
    return;

  auto key = detail::to_key(*rctx->msg.address);
  if (transfers_.contains(static_cast<session::socket_type>(*socket.socket)))
    return service(ctx, socket, rctx, buf, key);

  request(ctx, socket, buf, key);
  reader(ctx, socket, rctx);
}
} // namespace netboot::tftp
