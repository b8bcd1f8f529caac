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
 * @file tftp.cpp
 * @brief This file defines the TFTP application logic.
 */
#include "netboot/tftp.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

#include <arpa/inet.h>
namespace netboot::tftp {
/** @brief Parses an unsigned option value. */
static auto to_number(std::string_view value,
                      std::uintmax_t &result) noexcept -> bool
{
  const auto *end = value.data() + value.size();
  auto [ptr, err] = std::from_chars(value.data(), end, result);
  return !value.empty() && err == std::errc{} && ptr == end;
}

/**
 * @brief Loads the next data block into the session buffer.
 * @details The buffer is laid out as `[header][blksize bytes]` and is
 * truncated to the number of bytes actually read. A block shorter than
 * blksize (possibly empty) is the last one, and releases the file.
 * @param state The session state.
 * @return 0 on success, IO_ERROR if the artifact could not be read.
 */
static auto send_next(session::state_t &state) -> std::uint16_t
{
  using enum messages::opcode_t;
  auto &buffer = state.buffer;

  state.block_num += 1; // block_num wraps on overflow.
  state.retries = 0;

  buffer.resize(sizeof(messages::data) + state.blksize);

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  auto *msg = reinterpret_cast<messages::data *>(buffer.data());
  msg->opc = htons(DATA);
  msg->block_num = htons(state.block_num);

  auto err = std::error_code();
  auto len = state.file->read(
      std::span(buffer).subspan(sizeof(messages::data)), err);
  if (err) [[unlikely]]
  {
    state.status = session::ERRORED;
    return messages::IO_ERROR;
  }

  buffer.resize(sizeof(messages::data) + len);
  if (len < state.blksize)
  {
    state.last_block = true;
    state.file.reset();
  }

  return 0;
}

auto negotiate(std::span<const messages::option> options, const config &conf,
               session &sess) -> std::vector<std::pair<std::string, std::string>>
{
  auto accepted = std::vector<std::pair<std::string, std::string>>();
  auto &state = sess.state;

  for (const auto &[option, value] : options)
  {
    auto name = std::string(option);
    std::ranges::transform(name, name.begin(), [](unsigned char chr) {
      return static_cast<char>(std::tolower(chr));
    });

    if (std::ranges::find(accepted, name,
                          &std::pair<std::string, std::string>::first) !=
        accepted.end())
    {
      continue;
    }

    auto number = std::uintmax_t{};
    if (name == "blksize" && to_number(value, number))
    {
      state.blksize = std::clamp<std::uintmax_t>(number, conf.blksize_min,
                                                 conf.blksize_max);
      accepted.emplace_back(name, std::to_string(state.blksize));
    }
    else if (name == "timeout" && to_number(value, number))
    {
      number = std::clamp<std::uintmax_t>(number, messages::TIMEOUT_MIN,
                                          messages::TIMEOUT_MAX);
      state.timeout = std::chrono::seconds(number);
      accepted.emplace_back(name, std::to_string(number));
    }
    else if (name == "tsize")
    {
      accepted.emplace_back(name, std::to_string(state.target.size));
    }
  }

  return accepted;
}

auto handle_request(const messages::request &req, const artifact_store &store,
                    const config &conf, session &sess) -> std::uint16_t
{
  using enum messages::opcode_t;
  auto &state = sess.state;

  // This server is read-only.
  if (req.opc == WRQ)
    return messages::ACCESS_VIOLATION;

  if (req.opc != RRQ || req.mode != messages::OCTET)
    return messages::ILLEGAL_OPERATION;

  auto err = std::error_code();
  state.target = store.resolve(req.filename, err);
  if (err)
  {
    if (err == std::errc::permission_denied)
      return messages::ACCESS_VIOLATION;

    return messages::FILE_NOT_FOUND;
  }

  state.file = store.open_range(state.target, 0, std::nullopt, err);
  if (!state.file)
    return messages::IO_ERROR;

  state.blksize = messages::DATALEN;
  state.timeout = conf.timeout;
  state.last_activity = session::clock::now();

  auto accepted = negotiate(req.options, conf, sess);
  if (accepted.empty())
  {
    state.status = session::TRANSFERRING;
    return send_next(state);
  }

  auto &buffer = state.buffer;
  buffer.assign({0, static_cast<char>(OACK)});
  for (const auto &[name, value] : accepted)
  {
    buffer.insert(buffer.end(), name.begin(), name.end());
    buffer.push_back('\0');
    buffer.insert(buffer.end(), value.begin(), value.end());
    buffer.push_back('\0');
  }

  state.status = session::NEGOTIATING;
  state.block_num = 0;
  state.retries = 0;
  return 0;
}

auto handle_ack(messages::ack ack, session &sess) -> std::uint16_t
{
  auto &state = sess.state;

  // Duplicate and out of order ACKs are ignored.
  if (ntohs(ack.block_num) != state.block_num)
    return 0;

  switch (state.status)
  {
    case session::NEGOTIATING:
      state.status = session::TRANSFERRING;
      return send_next(state);

    case session::TRANSFERRING:
      if (!state.last_block)
        return send_next(state);

      state.status = session::COMPLETED;
      state.buffer.clear();
      return 0;

    default:
      return 0;
  }
}

auto handle_timeout(session &sess, unsigned max_retries) -> std::uint16_t
{
  auto &state = sess.state;
  if (++state.retries >= max_retries)
  {
    state.status = session::ERRORED;
    return messages::TIMED_OUT;
  }

  return 0;
}
} // namespace netboot::tftp
