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
 * @file http_protocol.hpp
 * @brief This file declares the HTTP/1.1 message model.
 */
#pragma once
#ifndef NETBOOT_HTTP_PROTOCOL_HPP
#define NETBOOT_HTTP_PROTOCOL_HPP
#include "netboot/artifact_store.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
/** @brief HTTP related utilities. */
namespace netboot::http {
/** @brief A header field. */
using header = std::pair<std::string, std::string>;

// NOLINTBEGIN(performance-enum-size)
/** @brief The status codes this server sends. */
enum status_t : std::uint16_t {
  OK = 200,
  PARTIAL_CONTENT = 206,
  NOT_MODIFIED = 304,
  BAD_REQUEST = 400,
  FORBIDDEN = 403,
  NOT_FOUND = 404,
  METHOD_NOT_ALLOWED = 405,
  RANGE_NOT_SATISFIABLE = 416,
  INTERNAL_SERVER_ERROR = 500
};
// NOLINTEND(performance-enum-size)

/** @brief The largest request head (request line and headers) accepted. */
static constexpr auto MAX_HEAD = 8192UL;
/** @brief The body chunk size. */
static constexpr auto CHUNK_SIZE = 65536UL;
/** @brief The Server header value. */
static constexpr auto SERVER_NAME = std::string_view("netboot");

/** @brief A parsed request head. */
struct request {
  /** @brief The request method, case-sensitive. */
  std::string method;
  /** @brief The raw request target. */
  std::string target;
  /** @brief The protocol version. */
  std::string version;
  /** @brief The header fields in arrival order. */
  std::vector<header> headers;

  /**
   * @brief Looks up a header field.
   * @param name The field name, compared case-insensitively.
   * @returns The first matching value.
   */
  [[nodiscard]] auto field(std::string_view name) const
      -> std::optional<std::string_view>;
};

/** @brief A response head plus its body source. */
struct response {
  /** @brief The status code. */
  std::uint16_t status = OK;
  /** @brief The header fields, excluding Server, Date and Connection. */
  std::vector<header> headers;
  /** @brief A generated body (error pages). */
  std::string body;
  /** @brief The artifact body, empty for HEAD and generated bodies. */
  std::shared_ptr<artifact_stream> stream;
};

/** @brief An inclusive byte range. */
struct byte_range {
  /** @brief The first byte. */
  std::uintmax_t first = 0;
  /** @brief The last byte. */
  std::uintmax_t last = 0;
};

/**
 * @brief Finds the end of the request head.
 * @param buf The bytes received so far.
 * @returns The offset just past the blank line, or std::string_view::npos.
 */
auto head_length(std::string_view buf) noexcept -> std::size_t;

/**
 * @brief Parses a request head.
 * @param head The request line and header fields.
 * @param[out] req The parsed request.
 * @returns true if the head is well formed.
 */
auto parse_request(std::string_view head, request &req) -> bool;

/**
 * @brief Percent-decodes a request target.
 * @details The query string and fragment are dropped.
 * @param target The raw request target.
 * @returns The decoded path, or std::nullopt if an escape is invalid or the
 * target is not in origin-form.
 */
auto decode_target(std::string_view target) -> std::optional<std::string>;

/**
 * @brief Evaluates a Range header.
 * @details Only a single range in bytes is honoured.
 * @param value The Range header value.
 * @param size The representation size.
 * @param[out] range The selected range, set for PARTIAL_CONTENT.
 * @returns PARTIAL_CONTENT for a satisfiable range, RANGE_NOT_SATISFIABLE
 * if it cannot be satisfied, OK if the header should be ignored.
 */
auto parse_range(std::string_view value, std::uintmax_t size,
                 byte_range &range) -> std::uint16_t;

/**
 * @brief Formats a time as an IMF-fixdate.
 * @param time The time to format.
 * @returns e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
 */
auto format_date(artifact::clock::time_point time) -> std::string;

/**
 * @brief Parses an IMF-fixdate.
 * @param value The date.
 * @returns The time, or std::nullopt if the value is not a date.
 */
auto parse_date(std::string_view value)
    -> std::optional<artifact::clock::time_point>;

/**
 * @brief Computes the entity tag of an artifact.
 * @param target The artifact.
 * @returns A strong entity tag derived from the size and modification time.
 */
auto make_etag(const artifact &target) -> std::string;

/**
 * @brief Maps a request to a response.
 * @param req The request.
 * @param store The artifact store to serve from.
 * @returns The response. A GET for an artifact carries an open stream.
 */
auto handle_request(const request &req, const artifact_store &store)
    -> response;

/**
 * @brief Builds a response with a short plain text body.
 * @param status The status code.
 * @returns The response.
 */
auto make_error(std::uint16_t status) -> response;

/**
 * @brief Serializes the response head, and the generated body if any.
 * @param res The response.
 * @param now The value of the Date header.
 * @param head_only Omit the body (HEAD requests).
 * @returns The bytes to send before the artifact stream.
 */
auto to_string(const response &res, artifact::clock::time_point now,
               bool head_only = false) -> std::string;

/**
 * @brief The reason phrase of a status code.
 * @param status The status code.
 * @returns The reason phrase.
 */
constexpr auto reason(std::uint16_t status) noexcept -> std::string_view
{
  switch (status)
  {
    case OK:
      return "OK";

    case PARTIAL_CONTENT:
      return "Partial Content";

    case NOT_MODIFIED:
      return "Not Modified";

    case BAD_REQUEST:
      return "Bad Request";

    case FORBIDDEN:
      return "Forbidden";

    case NOT_FOUND:
      return "Not Found";

    case METHOD_NOT_ALLOWED:
      return "Method Not Allowed";

    case RANGE_NOT_SATISFIABLE:
      return "Range Not Satisfiable";

    default:
      return "Internal Server Error";
  }
}
} // namespace netboot::http
#endif // NETBOOT_HTTP_PROTOCOL_HPP
