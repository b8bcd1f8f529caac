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
 * @file argument_parser.hpp
 * @brief This file declares a CLI argument parser.
 */
#pragma once
#ifndef NETBOOT_ARGUMENT_PARSER_HPP
#define NETBOOT_ARGUMENT_PARSER_HPP
#include <span>
#include <string_view>
#include <vector>
/** @brief For internal netboot implementation details. */
namespace netboot::detail {
/** @brief A command line argument parser. */
struct argument_parser {
  /** @brief Command-line arguments are parsed into options. */
  struct option {
    /** @brief option flag. */
    std::string_view flag;
    /** @brief option value. */
    std::string_view value;
  };
  /**
   * @brief Parse all command-line arguments.
   * @details A flag is any token beginning with '-'. A flag takes the next
   * token as its value unless that token is itself a flag. Long flags may
   * also carry their value inline as `--flag=value`. Tokens that follow a
   * flag which already has a value are returned with an empty flag.
   * @param args The command line arguments to parse (including argv[0]).
   * @returns The parsed options in command-line order.
   */
  static auto parse(std::span<char const *const> args) -> std::vector<option>;
  /**
   * @brief Parse all command-line arguments.
   * @param argc The number of command-line arguments.
   * @param argv The command-line arguments.
   * @returns The parsed options in command-line order.
   */
  static auto parse(int argc, char const *const *argv) -> std::vector<option>
  {
    return parse({argv, static_cast<std::size_t>(argc)});
  }
};
} // namespace netboot::detail
#endif // NETBOOT_ARGUMENT_PARSER_HPP
