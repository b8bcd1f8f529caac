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
 * @file artifact_store.cpp
 * @brief This file implements the read-only artifact store.
 */
#include "netboot/artifact_store.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

#include <sys/stat.h>
namespace netboot {
/** @brief Extension to MIME type table. */
static constexpr auto mime_types =
    std::array<std::pair<std::string_view, std::string_view>, 16>{{
        {".cfg", "text/plain"},
        {".efi", "application/efi"},
        {".gz", "application/gzip"},
        {".htm", "text/html"},
        {".html", "text/html"},
        {".ign", "application/json"},
        {".img", "application/octet-stream"},
        {".ipxe", "text/plain"},
        {".iso", "application/x-iso9660-image"},
        {".json", "application/json"},
        {".kpxe", "application/octet-stream"},
        {".pxe", "application/octet-stream"},
        {".raw", "application/octet-stream"},
        {".txt", "text/plain"},
        {".xz", "application/x-xz"},
        {".zst", "application/zstd"},
    }};

artifact_stream::artifact_stream(const std::filesystem::path &location,
                                 std::uintmax_t offset, std::uintmax_t length)
    : file_(location, std::ios::in | std::ios::binary), remaining_(length)
{
  if (file_.is_open() && offset > 0)
    file_.seekg(static_cast<std::streamoff>(offset));
}

auto artifact_stream::is_open() const noexcept -> bool
{
  return file_.is_open() && !file_.fail();
}

auto artifact_stream::read(std::span<char> buf,
                           std::error_code &err) -> std::size_t
{
  err.clear();
  auto count = static_cast<std::size_t>(
      std::min<std::uintmax_t>(buf.size(), remaining_));
  if (count == 0)
    return 0;

  file_.read(buf.data(), static_cast<std::streamsize>(count));
  auto len = static_cast<std::size_t>(file_.gcount());
  remaining_ -= len;

  // The stream was sized when the artifact was resolved, so running out of
  // file early means it was truncated underneath us.
  if (file_.bad() || len < count) [[unlikely]]
    err = std::make_error_code(std::errc::io_error);

  return len;
}

artifact_store::artifact_store(const std::filesystem::path &root,
                               std::error_code &err)
    : root_(std::filesystem::canonical(root, err))
{}

auto artifact_store::normalize(std::string_view logical_path)
    -> std::optional<std::string>
{
  auto segments = std::vector<std::string_view>();
  while (!logical_path.empty())
  {
    auto pos = logical_path.find('/');
    auto segment = logical_path.substr(0, pos);
    logical_path.remove_prefix(
        pos == std::string_view::npos ? logical_path.size() : pos + 1);

    if (segment.empty() || segment == ".")
      continue;

    if (segment == "..")
    {
      if (segments.empty())
        return std::nullopt;

      segments.pop_back();
      continue;
    }

    segments.push_back(segment);
  }

  auto path = std::string();
  for (const auto &segment : segments)
  {
    if (!path.empty())
      path.push_back('/');
    path.append(segment);
  }
  return path;
}

auto artifact_store::content_type(
    const std::filesystem::path &filename) -> std::string_view
{
  auto ext = filename.extension().string();
  std::ranges::transform(ext, ext.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });

  auto found = std::ranges::find(
      mime_types, std::string_view(ext),
      &std::pair<std::string_view, std::string_view>::first);
  if (found == mime_types.end())
    return "application/octet-stream";

  return found->second;
}

/** @brief Tests whether `path` lies inside (or is) `root`. */
static auto is_within(const std::filesystem::path &root,
                      const std::filesystem::path &path) -> bool
{
  auto [rit, pit] = std::mismatch(root.begin(), root.end(), path.begin(),
                                  path.end());
  return rit == root.end();
}

auto artifact_store::resolve(std::string_view logical_path,
                             std::error_code &err) const -> artifact
{
  using clock = artifact::clock;
  err.clear();

  auto normalized = normalize(logical_path);
  if (!normalized)
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  if (normalized->empty())
  {
    err = std::make_error_code(std::errc::no_such_file_or_directory);
    return {};
  }

  // Forbidden is reserved for escapes, a path that cannot be walked is absent.
  auto location = std::filesystem::canonical(root_ / *normalized, err);
  if (err)
  {
    err = std::make_error_code(std::errc::no_such_file_or_directory);
    return {};
  }

  // Symlinks may point anywhere, so check the resolved location too.
  if (!is_within(root_, location))
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  struct stat st = {};
  if (::stat(location.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
  {
    err = std::make_error_code(std::errc::no_such_file_or_directory);
    return {};
  }

  auto mtime = clock::time_point(std::chrono::duration_cast<clock::duration>(
      std::chrono::seconds(st.st_mtim.tv_sec) +
      std::chrono::nanoseconds(st.st_mtim.tv_nsec)));

  return {.logical_path = std::move(*normalized),
          .location = std::move(location),
          .size = static_cast<std::uintmax_t>(st.st_size),
          .mtime = mtime,
          .content_type = content_type(std::filesystem::path(logical_path))};
}

auto artifact_store::open_range(const artifact &target, std::uintmax_t offset,
                                std::optional<std::uintmax_t> length,
                                std::error_code &err) const
    -> std::shared_ptr<artifact_stream>
{
  err.clear();
  offset = std::min(offset, target.size);
  auto count = std::min(length.value_or(target.size), target.size - offset);

  auto stream =
      std::make_shared<artifact_stream>(target.location, offset, count);

  // The artifact was found, so it was removed or lost its permissions since.
  if (!stream->is_open())
  {
    err = std::make_error_code(std::errc::io_error);
    return {};
  }

  return stream;
}
} // namespace netboot
