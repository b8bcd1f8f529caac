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
 * @file argument_parser.cpp
 * @brief This file implements a CLI argument parser.
 */
#include "netboot/detail/argument_parser.hpp"

#include <algorithm>
namespace netboot::detail {

static constexpr auto is_flag(std::string_view token) noexcept -> bool
{
  return token.size() > 1 && token.front() == '-';
}

auto argument_parser::parse(std::span<char const *const> args)
    -> std::vector<option>
{
  auto options = std::vector<option>();
  if (args.empty())
    return options;

  auto open = false; // The last flag is still waiting for a value.
  for (const auto *arg : args.subspan(1))
  {
    auto token = std::string_view(arg);
    if (is_flag(token))
    {
      auto opt = option{.flag = token};
      open = true;

      if (token.starts_with("--"))
      {
        const auto *delim = std::ranges::find(token, '=');
        if (delim != token.cend())
        {
          opt.flag = {token.cbegin(), delim};
          // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          opt.value = {delim + 1, token.cend()};
          open = false;
        }
      }

      options.push_back(opt);
      continue;
    }

    if (open)
    {
      options.back().value = token;
      open = false;
      continue;
    }

    options.push_back(option{.value = token});
  }

  return options;
}
} // namespace netboot::detail
