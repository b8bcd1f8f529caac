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
#include "netboot/protocol/http_protocol.hpp"

#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <filesystem>
#include <format>
#include <fstream>

#include <unistd.h>

using namespace netboot;
using namespace netboot::http;
using namespace std::chrono_literals;

static inline auto http_counter = std::atomic<unsigned>();

class HttpTest : public ::testing::Test {
protected:
  std::filesystem::path root;
  std::unique_ptr<artifact_store> store;
  std::string content;

  void SetUp() override
  {
    root = std::filesystem::temp_directory_path() /
           std::format("netboot-http.{:05d}", http_counter++);
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "ipxe");

    content.resize(1000);
    for (std::size_t i = 0; i < content.size(); ++i)
      content[i] = static_cast<char>('a' + i % 26);

    write(root / "vmlinuz", content);
    write(root / "ipxe" / "index.html", "<html></html>\n");

    auto err = std::error_code();
    store = std::make_unique<artifact_store>(root, err);
    ASSERT_FALSE(err);
  }

  void TearDown() override { std::filesystem::remove_all(root); }

  static void write(const std::filesystem::path &path,
                    const std::string &data)
  {
    auto file = std::ofstream(path, std::ios::binary);
    file << data;
  }

  static auto get(std::string target, std::vector<header> headers = {})
      -> request
  {
    return {.method = "GET",
            .target = std::move(target),
            .version = "HTTP/1.1",
            .headers = std::move(headers)};
  }

  static auto field(const response &res, std::string_view name)
      -> std::string
  {
    for (const auto &[key, value] : res.headers)
    {
      if (key == name)
        return value;
    }
    return {};
  }

  static auto drain(artifact_stream &stream) -> std::string
  {
    auto out = std::string();
    auto buf = std::array<char, 256>{};
    auto err = std::error_code();
    while (stream.remaining() > 0)
    {
      auto len = stream.read(buf, err);
      if (err || len == 0)
        break;
      out.append(buf.data(), len);
    }
    return out;
  }

  auto etag() -> std::string
  {
    auto err = std::error_code();
    return make_etag(store->resolve("vmlinuz", err));
  }
};

// =============================================================================
// Request parsing
// =============================================================================
TEST_F(HttpTest, HeadLength)
{
  EXPECT_EQ(head_length("GET / HTTP/1.1\r\nHost: x\r\n\r\nbody"), 27U);
  EXPECT_EQ(head_length("GET / HTTP/1.1\n\n"), 16U);
  EXPECT_EQ(head_length("GET / HTTP/1.1\r\nHost: x\r\n"),
            std::string_view::npos);
}

TEST_F(HttpTest, ParseRequest)
{
  auto req = request{};
  ASSERT_TRUE(parse_request("GET /boot.ipxe HTTP/1.1\r\n"
                            "Host: 192.0.2.1\r\n"
                            "Range:  bytes=0-99 \r\n"
                            "\r\n",
                            req));
  EXPECT_EQ(req.method, "GET");
  EXPECT_EQ(req.target, "/boot.ipxe");
  EXPECT_EQ(req.version, "HTTP/1.1");
  ASSERT_EQ(req.headers.size(), 2U);
  EXPECT_EQ(req.field("host"), "192.0.2.1");
  EXPECT_EQ(req.field("RANGE"), "bytes=0-99");
  EXPECT_EQ(req.field("If-Range"), std::nullopt);
}

TEST_F(HttpTest, ParseRequestRejectsMalformed)
{
  auto req = request{};
  EXPECT_FALSE(parse_request("GET /\r\n\r\n", req));
  EXPECT_FALSE(parse_request("GET / HTTP/2\r\n\r\n", req));
  EXPECT_FALSE(parse_request("G(T / HTTP/1.1\r\n\r\n", req));
  EXPECT_FALSE(parse_request(" / HTTP/1.1\r\n\r\n", req));

  req = {};
  EXPECT_FALSE(parse_request("GET / HTTP/1.1\r\nNoColon\r\n\r\n", req));

  req = {};
  EXPECT_FALSE(parse_request("GET / HTTP/1.1\r\n: empty\r\n\r\n", req));

  req = {};
  EXPECT_FALSE(parse_request("GET / HTTP/1.1\r\n"
                             "X-Long: a\r\n"
                             " folded\r\n\r\n",
                             req));
}

TEST_F(HttpTest, DecodeTarget)
{
  EXPECT_EQ(decode_target("/ipxe/boot%20menu.ipxe?arch=x86_64#top"),
            "/ipxe/boot menu.ipxe");
  EXPECT_EQ(decode_target("http://192.0.2.1:8080/vmlinuz"), "/vmlinuz");
  EXPECT_EQ(decode_target("HTTP://host"), "/");
  EXPECT_EQ(decode_target("/%2E%2e/etc/passwd"), "/../etc/passwd");

  EXPECT_EQ(decode_target("*"), std::nullopt);
  EXPECT_EQ(decode_target("/bad%zzescape"), std::nullopt);
  EXPECT_EQ(decode_target("/truncated%4"), std::nullopt);
  EXPECT_EQ(decode_target("/nul%00byte"), std::nullopt);
}

// =============================================================================
// Ranges and dates
// =============================================================================
TEST_F(HttpTest, ParseRange)
{
  auto range = byte_range{};

  ASSERT_EQ(parse_range("bytes=100-199", 1000, range), PARTIAL_CONTENT);
  EXPECT_EQ(range.first, 100U);
  EXPECT_EQ(range.last, 199U);

  ASSERT_EQ(parse_range("bytes=500-", 1000, range), PARTIAL_CONTENT);
  EXPECT_EQ(range.first, 500U);
  EXPECT_EQ(range.last, 999U);

  ASSERT_EQ(parse_range("bytes=-100", 1000, range), PARTIAL_CONTENT);
  EXPECT_EQ(range.first, 900U);
  EXPECT_EQ(range.last, 999U);

  ASSERT_EQ(parse_range("bytes=-5000", 1000, range), PARTIAL_CONTENT);
  EXPECT_EQ(range.first, 0U);

  ASSERT_EQ(parse_range("bytes=990-5000", 1000, range), PARTIAL_CONTENT);
  EXPECT_EQ(range.last, 999U);

  EXPECT_EQ(parse_range("bytes=2000-", 1000, range), RANGE_NOT_SATISFIABLE);
  EXPECT_EQ(parse_range("bytes=1000-1000", 1000, range),
            RANGE_NOT_SATISFIABLE);
  EXPECT_EQ(parse_range("bytes=-0", 1000, range), RANGE_NOT_SATISFIABLE);
  EXPECT_EQ(parse_range("bytes=0-", 0, range), RANGE_NOT_SATISFIABLE);
}

TEST_F(HttpTest, ParseRangeIgnoresUnsupported)
{
  auto range = byte_range{};
  EXPECT_EQ(parse_range("bytes=0-1,5-6", 1000, range), OK);
  EXPECT_EQ(parse_range("items=0-1", 1000, range), OK);
  EXPECT_EQ(parse_range("bytes=5-1", 1000, range), OK);
  EXPECT_EQ(parse_range("bytes=x-1", 1000, range), OK);
  EXPECT_EQ(parse_range("bytes=", 1000, range), OK);
}

TEST_F(HttpTest, Dates)
{
  auto time = artifact::clock::from_time_t(784111777);
  EXPECT_EQ(format_date(time), "Sun, 06 Nov 1994 08:49:37 GMT");
  EXPECT_EQ(format_date(time + 999ms), "Sun, 06 Nov 1994 08:49:37 GMT");

  EXPECT_EQ(parse_date("Sun, 06 Nov 1994 08:49:37 GMT"), time);
  EXPECT_EQ(parse_date("Sunday, 06-Nov-94 08:49:37 GMT"), std::nullopt);
  EXPECT_EQ(parse_date("yesterday"), std::nullopt);
}

// =============================================================================
// handle_request
// =============================================================================
TEST_F(HttpTest, GetFullArtifact)
{
  auto res = handle_request(get("/vmlinuz"), *store);

  EXPECT_EQ(res.status, OK);
  EXPECT_EQ(field(res, "Content-Length"), "1000");
  EXPECT_EQ(field(res, "Content-Type"), "application/octet-stream");
  EXPECT_EQ(field(res, "Accept-Ranges"), "bytes");
  EXPECT_EQ(field(res, "ETag"), etag());
  EXPECT_FALSE(field(res, "Last-Modified").empty());
  ASSERT_TRUE(res.stream);
  EXPECT_EQ(drain(*res.stream), content);
}

TEST_F(HttpTest, HeadHasNoStream)
{
  auto req = get("/vmlinuz");
  req.method = "HEAD";
  auto res = handle_request(req, *store);

  EXPECT_EQ(res.status, OK);
  EXPECT_EQ(field(res, "Content-Length"), "1000");
  EXPECT_FALSE(res.stream);
}

TEST_F(HttpTest, DirectoryServesIndex)
{
  auto res = handle_request(get("/ipxe/"), *store);
  EXPECT_EQ(res.status, OK);
  EXPECT_EQ(field(res, "Content-Type"), "text/html");
  EXPECT_EQ(field(res, "Content-Length"), "14");
}

TEST_F(HttpTest, MethodNotAllowed)
{
  auto req = get("/vmlinuz");
  req.method = "PUT";
  auto res = handle_request(req, *store);

  EXPECT_EQ(res.status, METHOD_NOT_ALLOWED);
  EXPECT_EQ(field(res, "Allow"), "GET, HEAD");
}

TEST_F(HttpTest, NotFound)
{
  EXPECT_EQ(handle_request(get("/initrd.img"), *store).status, NOT_FOUND);
  EXPECT_EQ(handle_request(get("/ipxe"), *store).status, NOT_FOUND);
}

TEST_F(HttpTest, TraversalIsForbidden)
{
  EXPECT_EQ(handle_request(get("/../etc/passwd"), *store).status, FORBIDDEN);
  EXPECT_EQ(handle_request(get("/%2e%2e/etc/passwd"), *store).status,
            FORBIDDEN);
}

TEST_F(HttpTest, UnreadableIsServerError)
{
  if (::geteuid() == 0)
    GTEST_SKIP() << "root ignores file permissions";

  std::filesystem::permissions(root / "vmlinuz", std::filesystem::perms::none);
  auto res = handle_request(get("/vmlinuz"), *store);
  EXPECT_EQ(res.status, INTERNAL_SERVER_ERROR);
  EXPECT_FALSE(res.stream);
}

TEST_F(HttpTest, BadTarget)
{
  EXPECT_EQ(handle_request(get("/bad%zz"), *store).status, BAD_REQUEST);
}

TEST_F(HttpTest, PartialContent)
{
  auto res = handle_request(get("/vmlinuz", {{"Range", "bytes=100-199"}}),
                            *store);

  EXPECT_EQ(res.status, PARTIAL_CONTENT);
  EXPECT_EQ(field(res, "Content-Range"), "bytes 100-199/1000");
  EXPECT_EQ(field(res, "Content-Length"), "100");
  ASSERT_TRUE(res.stream);
  EXPECT_EQ(drain(*res.stream), content.substr(100, 100));
}

TEST_F(HttpTest, RangeNotSatisfiable)
{
  auto res =
      handle_request(get("/vmlinuz", {{"Range", "bytes=2000-"}}), *store);

  EXPECT_EQ(res.status, RANGE_NOT_SATISFIABLE);
  EXPECT_EQ(field(res, "Content-Range"), "bytes */1000");
  EXPECT_FALSE(res.stream);
}

TEST_F(HttpTest, IfNoneMatch)
{
  auto res =
      handle_request(get("/vmlinuz", {{"If-None-Match", etag()}}), *store);
  EXPECT_EQ(res.status, NOT_MODIFIED);
  EXPECT_EQ(field(res, "ETag"), etag());
  EXPECT_FALSE(res.stream);

  res = handle_request(
      get("/vmlinuz", {{"If-None-Match", "\"other\", W/" + etag()}}), *store);
  EXPECT_EQ(res.status, NOT_MODIFIED);

  res = handle_request(get("/vmlinuz", {{"If-None-Match", "*"}}), *store);
  EXPECT_EQ(res.status, NOT_MODIFIED);

  res = handle_request(get("/vmlinuz", {{"If-None-Match", "\"other\""}}),
                       *store);
  EXPECT_EQ(res.status, OK);
}

TEST_F(HttpTest, IfNoneMatchTakesPrecedence)
{
  auto future = format_date(artifact::clock::now() + 24h);
  auto res = handle_request(get("/vmlinuz", {{"If-None-Match", "\"other\""},
                                             {"If-Modified-Since", future}}),
                            *store);
  EXPECT_EQ(res.status, OK);
}

TEST_F(HttpTest, IfModifiedSince)
{
  auto future = format_date(artifact::clock::now() + 24h);
  auto res = handle_request(get("/vmlinuz", {{"If-Modified-Since", future}}),
                            *store);
  EXPECT_EQ(res.status, NOT_MODIFIED);

  auto past = format_date(artifact::clock::from_time_t(784111777));
  res = handle_request(get("/vmlinuz", {{"If-Modified-Since", past}}), *store);
  EXPECT_EQ(res.status, OK);

  res = handle_request(get("/vmlinuz", {{"If-Modified-Since", "garbage"}}),
                       *store);
  EXPECT_EQ(res.status, OK);
}

TEST_F(HttpTest, IfRange)
{
  auto res = handle_request(get("/vmlinuz", {{"Range", "bytes=0-9"},
                                             {"If-Range", etag()}}),
                            *store);
  EXPECT_EQ(res.status, PARTIAL_CONTENT);

  res = handle_request(get("/vmlinuz", {{"Range", "bytes=0-9"},
                                        {"If-Range", "\"stale\""}}),
                       *store);
  EXPECT_EQ(res.status, OK);
  EXPECT_EQ(field(res, "Content-Length"), "1000");

  res = handle_request(get("/vmlinuz", {{"Range", "bytes=0-9"},
                                        {"If-Range", "W/" + etag()}}),
                       *store);
  EXPECT_EQ(res.status, OK);
}

// =============================================================================
// Serialization
// =============================================================================
TEST_F(HttpTest, SerializeError)
{
  auto now = artifact::clock::from_time_t(784111777);
  auto out = to_string(make_error(NOT_FOUND), now);

  EXPECT_TRUE(out.starts_with("HTTP/1.1 404 Not Found\r\n"));
  EXPECT_NE(out.find("\r\nServer: netboot\r\n"), std::string::npos);
  EXPECT_NE(out.find("\r\nDate: Sun, 06 Nov 1994 08:49:37 GMT\r\n"),
            std::string::npos);
  EXPECT_NE(out.find("\r\nContent-Length: 14\r\n"), std::string::npos);
  EXPECT_NE(out.find("\r\nConnection: close\r\n\r\n"), std::string::npos);
  EXPECT_TRUE(out.ends_with("\r\n\r\n404 Not Found\n"));
}

TEST_F(HttpTest, SerializeHeadOmitsBody)
{
  auto now = artifact::clock::now();
  auto out = to_string(make_error(METHOD_NOT_ALLOWED), now, true);

  EXPECT_TRUE(out.starts_with("HTTP/1.1 405 Method Not Allowed\r\n"));
  EXPECT_TRUE(out.ends_with("\r\n\r\n"));
}

TEST_F(HttpTest, ReasonPhrases)
{
  static_assert(reason(OK) == "OK");
  static_assert(reason(PARTIAL_CONTENT) == "Partial Content");
  static_assert(reason(RANGE_NOT_SATISFIABLE) == "Range Not Satisfiable");
  EXPECT_EQ(reason(599), "Internal Server Error");
}

// NOLINTEND
