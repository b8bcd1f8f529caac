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
 * @file http.cpp
 * @brief This file defines the HTTP artifact handler.
 */
#include "netboot/protocol/http_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <format>
#include <limits>

#include <time.h>
namespace netboot::http {
/** @brief Optional whitespace. */
static constexpr auto OWS = std::string_view(" \t");

/** @brief Strips optional whitespace from both ends. */
static auto trim(std::string_view str) noexcept -> std::string_view
{
  auto first = str.find_first_not_of(OWS);
  if (first == std::string_view::npos)
    return {};

  auto last = str.find_last_not_of(OWS);
  return str.substr(first, last - first + 1);
}

/** @brief Case-insensitive string comparison. */
static auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool
{
  return std::ranges::equal(lhs, rhs, [](unsigned char lhs, unsigned char rhs) {
    return std::tolower(lhs) == std::tolower(rhs);
  });
}

/** @brief Parses a decimal number that must fill the whole string. */
static auto to_number(std::string_view value,
                      std::uintmax_t &result) noexcept -> bool
{
  const auto *end = value.data() + value.size();
  auto [ptr, err] = std::from_chars(value.data(), end, result);
  return !value.empty() && err == std::errc{} && ptr == end;
}

/** @brief Tests whether chr may appear in a header field name. */
static auto is_tchar(unsigned char chr) noexcept -> bool
{
  static constexpr auto specials = std::string_view("!#$%&'*+-.^_`|~");
  return std::isalnum(chr) || specials.find(static_cast<char>(chr)) !=
                                  std::string_view::npos;
}

auto request::field(std::string_view name) const
    -> std::optional<std::string_view>
{
  auto found = std::ranges::find_if(
      headers, [&](const auto &hdr) { return iequals(hdr.first, name); });
  if (found == headers.end())
    return std::nullopt;

  return found->second;
}

auto head_length(std::string_view buf) noexcept -> std::size_t
{
  auto crlf = buf.find("\r\n\r\n");
  auto lf = buf.find("\n\n");
  if (crlf == std::string_view::npos && lf == std::string_view::npos)
    return std::string_view::npos;

  if (crlf < lf)
    return crlf + 4;

  return lf + 2;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
auto parse_request(std::string_view head, request &req) -> bool
{
  auto next_line = [&]() -> std::string_view {
    auto pos = head.find('\n');
    auto line = head.substr(0, pos);
    head.remove_prefix(pos == std::string_view::npos ? head.size() : pos + 1);
    if (line.ends_with('\r'))
      line.remove_suffix(1);
    return line;
  };

  auto line = next_line();
  auto method_end = line.find(' ');
  auto target_end = line.find(' ', method_end + 1);
  if (method_end == std::string_view::npos ||
      target_end == std::string_view::npos)
  {
    return false;
  }

  req.method = line.substr(0, method_end);
  req.target = line.substr(method_end + 1, target_end - method_end - 1);
  req.version = line.substr(target_end + 1);
  if (req.method.empty() || req.target.empty() ||
      !std::ranges::all_of(req.method, is_tchar) ||
      req.target.find(' ') != std::string::npos ||
      !req.version.starts_with("HTTP/1."))
  {
    return false;
  }

  while (!head.empty())
  {
    line = next_line();
    if (line.empty())
      break;

    auto colon = line.find(':');
    if (colon == 0 || colon == std::string_view::npos)
      return false;

    // Also rejects obsolete line folding.
    auto name = line.substr(0, colon);
    if (!std::ranges::all_of(name, is_tchar))
      return false;

    req.headers.emplace_back(name, trim(line.substr(colon + 1)));
  }

  return true;
}

auto decode_target(std::string_view target) -> std::optional<std::string>
{
  // absolute-form: drop the scheme and authority.
  for (auto scheme : {std::string_view("http://"), std::string_view("https://")})
  {
    if (target.size() >= scheme.size() &&
        iequals(target.substr(0, scheme.size()), scheme))
    {
      auto path = target.find('/', scheme.size());
      target = path == std::string_view::npos ? std::string_view("/")
                                              : target.substr(path);
      break;
    }
  }

  target = target.substr(0, target.find_first_of("?#"));
  if (!target.starts_with('/'))
    return std::nullopt;

  auto path = std::string();
  path.reserve(target.size());
  for (std::size_t i = 0; i < target.size(); ++i)
  {
    if (target[i] != '%')
    {
      path.push_back(target[i]);
      continue;
    }

    auto chr = std::uint8_t{};
    const auto *first = target.data() + i + 1;
    auto [ptr, err] = std::from_chars(
        first, target.data() + std::min(i + 3, target.size()), chr, 16);
    if (err != std::errc{} || ptr != first + 2 || chr == 0)
      return std::nullopt;

    path.push_back(static_cast<char>(chr));
    i += 2;
  }

  return path;
}

auto parse_range(std::string_view value, std::uintmax_t size,
                 byte_range &range) -> std::uint16_t
{
  static constexpr auto unit = std::string_view("bytes=");
  value = trim(value);
  if (value.size() < unit.size() || !iequals(value.substr(0, unit.size()), unit))
    return OK;

  auto ranges = trim(value.substr(unit.size()));
  auto dash = ranges.find('-');
  if (ranges.find(',') != std::string_view::npos ||
      dash == std::string_view::npos)
  {
    return OK;
  }

  auto first = trim(ranges.substr(0, dash));
  auto last = trim(ranges.substr(dash + 1));

  // bytes=-n selects the final n bytes.
  if (first.empty())
  {
    auto suffix = std::uintmax_t{};
    if (!to_number(last, suffix))
      return OK;

    if (suffix == 0 || size == 0)
      return RANGE_NOT_SATISFIABLE;

    range = {.first = size - std::min(suffix, size), .last = size - 1};
    return PARTIAL_CONTENT;
  }

  auto begin = std::uintmax_t{};
  auto end = std::numeric_limits<std::uintmax_t>::max();
  if (!to_number(first, begin) || (!last.empty() && !to_number(last, end)))
    return OK;

  if (end < begin)
    return OK;

  if (begin >= size)
    return RANGE_NOT_SATISFIABLE;

  range = {.first = begin, .last = std::min(end, size - 1)};
  return PARTIAL_CONTENT;
}

auto format_date(artifact::clock::time_point time) -> std::string
{
  return std::format("{:%a, %d %b %Y %H:%M:%S} GMT",
                     std::chrono::floor<std::chrono::seconds>(time));
}

auto parse_date(std::string_view value)
    -> std::optional<artifact::clock::time_point>
{
  auto str = std::string(trim(value));
  auto tm = std::tm{};
  const auto *end = strptime(str.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  if (end == nullptr || *end != '\0')
    return std::nullopt;

  return artifact::clock::from_time_t(timegm(&tm));
}

auto make_etag(const artifact &target) -> std::string
{
  auto mtime = std::chrono::duration_cast<std::chrono::nanoseconds>(
      target.mtime.time_since_epoch());
  return std::format("\"{:x}-{:x}\"", target.size, mtime.count());
}

/** @brief Evaluates If-None-Match, falling back to If-Modified-Since. */
static auto not_modified(const request &req, const artifact &target,
                         std::string_view etag) -> bool
{
  auto weak = [](std::string_view tag) {
    tag = trim(tag);
    if (tag.starts_with("W/"))
      tag.remove_prefix(2);
    return tag;
  };

  if (auto tags = req.field("If-None-Match"))
  {
    while (!tags->empty())
    {
      auto comma = tags->find(',');
      auto tag = weak(tags->substr(0, comma));
      tags->remove_prefix(comma == std::string_view::npos ? tags->size()
                                                          : comma + 1);
      if (tag == "*" || tag == weak(etag))
        return true;
    }
    return false;
  }

  if (auto since = req.field("If-Modified-Since"))
  {
    auto date = parse_date(*since);
    return date && std::chrono::floor<std::chrono::seconds>(target.mtime) <=
                       *date;
  }

  return false;
}

/** @brief Evaluates If-Range; true if a Range header may be honoured. */
static auto if_range(const request &req, const artifact &target,
                     std::string_view etag) -> bool
{
  auto value = req.field("If-Range");
  if (!value)
    return true;

  auto validator = trim(*value);
  if (validator.starts_with('"'))
    return validator == etag;

  // Weak tags never match.
  if (validator.starts_with("W/"))
    return false;

  auto date = parse_date(validator);
  return date && std::chrono::floor<std::chrono::seconds>(target.mtime) == *date;
}

/** @brief Maps a store error to a status code. */
static auto to_status(const std::error_code &err) noexcept -> std::uint16_t
{
  if (err == std::errc::no_such_file_or_directory)
    return NOT_FOUND;

  if (err == std::errc::permission_denied)
    return FORBIDDEN;

  return INTERNAL_SERVER_ERROR;
}

auto make_error(std::uint16_t status) -> response
{
  auto res = response{.status = status};
  res.body = std::format("{} {}\n", status, reason(status));
  res.headers = {{"Content-Type", "text/plain; charset=utf-8"},
                 {"Content-Length", std::to_string(res.body.size())}};
  return res;
}

auto handle_request(const request &req, const artifact_store &store)
    -> response
{
  if (req.method != "GET" && req.method != "HEAD")
  {
    auto res = make_error(METHOD_NOT_ALLOWED);
    res.headers.emplace_back("Allow", "GET, HEAD");
    return res;
  }

  auto path = decode_target(req.target);
  if (!path)
    return make_error(BAD_REQUEST);

  if (path->ends_with('/'))
    path->append("index.html");

  auto err = std::error_code();
  auto target = store.resolve(*path, err);
  if (err)
    return make_error(to_status(err));

  auto etag = make_etag(target);
  auto res = response{};
  res.headers = {{"Content-Type", std::string(target.content_type)},
                 {"Last-Modified", format_date(target.mtime)},
                 {"ETag", etag},
                 {"Accept-Ranges", "bytes"}};

  if (not_modified(req, target, etag))
  {
    res.status = NOT_MODIFIED;
    return res;
  }

  auto offset = std::uintmax_t{0};
  auto length = target.size;
  if (auto value = req.field("Range"); value && if_range(req, target, etag))
  {
    auto range = byte_range{};
    switch (parse_range(*value, target.size, range))
    {
      case PARTIAL_CONTENT:
        res.status = PARTIAL_CONTENT;
        offset = range.first;
        length = range.last - range.first + 1;
        res.headers.emplace_back(
            "Content-Range",
            std::format("bytes {}-{}/{}", range.first, range.last, target.size));
        break;

      case RANGE_NOT_SATISFIABLE:
      {
        auto unsatisfiable = make_error(RANGE_NOT_SATISFIABLE);
        unsatisfiable.headers.emplace_back(
            "Content-Range", std::format("bytes */{}", target.size));
        return unsatisfiable;
      }

      default:
        break;
    }
  }

  res.headers.emplace_back("Content-Length", std::to_string(length));
  if (req.method == "GET")
  {
    res.stream = store.open_range(target, offset, length, err);
    if (!res.stream)
      return make_error(to_status(err));
  }

  return res;
}

auto to_string(const response &res, artifact::clock::time_point now,
               bool head_only) -> std::string
{
  auto out = std::format("HTTP/1.1 {} {}\r\n"
                         "Server: {}\r\n"
                         "Date: {}\r\n",
                         res.status, reason(res.status), SERVER_NAME,
                         format_date(now));

  for (const auto &[name, value] : res.headers)
    out.append(std::format("{}: {}\r\n", name, value));

  out.append("Connection: close\r\n\r\n");
  if (!head_only)
    out.append(res.body);

  return out;
}
} // namespace netboot::http
