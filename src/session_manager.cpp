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
 * @file session_manager.cpp
 * @brief This file defines the TFTP session table.
 */
#include "netboot/tftp/session_manager.hpp"
namespace netboot::tftp {

auto session_manager::create_if_absent(const key_type &key,
                                       std::error_code &err,
                                       session_ptr sess) -> session_ptr
{
  auto lock = std::lock_guard{mtx_};
  err.clear();

  if (sessions_.contains(key))
  {
    err = std::make_error_code(std::errc::address_in_use);
    return {};
  }

  if (sessions_.size() >= max_sessions_)
  {
    err = std::make_error_code(std::errc::resource_unavailable_try_again);
    return {};
  }

  auto [it, inserted] = sessions_.emplace(key, std::move(sess));
  return it->second;
}

auto session_manager::lookup(const key_type &key) const -> session_ptr
{
  auto lock = std::lock_guard{mtx_};
  if (auto it = sessions_.find(key); it != sessions_.end())
    return it->second;

  return {};
}

auto session_manager::remove(const key_type &key) -> session_ptr
{
  auto lock = std::lock_guard{mtx_};
  auto node = sessions_.extract(key);
  if (node.empty())
    return {};

  return std::move(node.mapped());
}

auto session_manager::size() const -> std::size_t
{
  auto lock = std::lock_guard{mtx_};
  return sessions_.size();
}

auto session_manager::sweep(session::timestamp now,
                            session::clock::duration idle) -> std::vector<entry>
{
  auto evicted = std::vector<entry>();
  auto lock = std::lock_guard{mtx_};

  for (auto it = sessions_.begin(); it != sessions_.end();)
  {
    if (now - it->second->state.last_activity > idle)
    {
      evicted.emplace_back(it->first, std::move(it->second));
      it = sessions_.erase(it);
    }
    else
    {
      ++it;
    }
  }

  return evicted;
}
} // namespace netboot::tftp
