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
#include "netboot/detail/argument_parser.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace netboot::detail;

struct ParseCase {
  std::vector<const char *> argv;

  struct expected_option {
    std::string_view flag;
    std::string_view value;
  };

  std::vector<expected_option> expected;
};

class ArgParseTest : public ::testing::TestWithParam<ParseCase> {};

TEST_P(ArgParseTest, ParseArgs)
{
  const auto &param = GetParam();
  auto options = argument_parser::parse(static_cast<int>(param.argv.size()),
                                        param.argv.data());

  ASSERT_EQ(options.size(), param.expected.size());
  for (std::size_t i = 0; i < options.size(); ++i)
  {
    EXPECT_EQ(options[i].flag, param.expected[i].flag) << "option " << i;
    EXPECT_EQ(options[i].value, param.expected[i].value) << "option " << i;
  }
}

INSTANTIATE_TEST_SUITE_P(
    ArgParseTestCases, ArgParseTest,
    ::testing::Values(
        ParseCase{{"netbootd"}, {}},
        ParseCase{{"netbootd", "-h"}, {{"-h", ""}}},
        ParseCase{{"netbootd", "--help"}, {{"--help", ""}}},
        ParseCase{{"netbootd", "--root-dir=/srv/boot"},
                  {{"--root-dir", "/srv/boot"}}},
        ParseCase{{"netbootd", "-r", "/srv/boot"}, {{"-r", "/srv/boot"}}},
        ParseCase{{"netbootd", "--no-tftp", "--no-http"},
                  {{"--no-tftp", ""}, {"--no-http", ""}}},
        ParseCase{{"netbootd", "-p", "-P"}, {{"-p", ""}, {"-P", ""}}},
        ParseCase{{"netbootd", "--blksize-max=", "-v"},
                  {{"--blksize-max", ""}, {"-v", ""}}},
        ParseCase{{"netbootd", "-", "-v"}, {{"-", ""}, {"-v", ""}}},
        ParseCase{{"netbootd", "--timeout=2", "3"},
                  {{"--timeout", "2"}, {"", "3"}}},
        ParseCase{{"netbootd", "69", "-p"}, {{"", "69"}, {"-p", ""}}},
        ParseCase{{"netbootd", "-l", "debug", "--grace", "10", "extra"},
                  {{"-l", "debug"}, {"--grace", "10"}, {"", "extra"}}}));

// NOLINTEND
