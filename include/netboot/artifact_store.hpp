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
 * @file artifact_store.hpp
 * @brief This file declares the read-only artifact store.
 */
#pragma once
#ifndef NETBOOT_ARTIFACT_STORE_HPP
#define NETBOOT_ARTIFACT_STORE_HPP
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
/** @namespace For top-level netboot services. */
namespace netboot {

/** @brief A boot artifact resolved from a logical path. */
struct artifact {
  /** @brief The clock used for modification times. */
  using clock = std::chrono::system_clock;

  /** @brief The canonical logical path (no leading '/'). */
  std::string logical_path;
  /** @brief The absolute, symlink-resolved location. */
  std::filesystem::path location;
  /** @brief The size in bytes observed at resolution time. */
  std::uintmax_t size = 0;
  /** @brief The last modification time. */
  clock::time_point mtime;
  /** @brief The inferred MIME type. */
  std::string_view content_type;
};

/**
 * @brief A bounded, sequential view over an artifact's bytes.
 * @details The stream never yields more than the byte count it was opened
 * with, even if the underlying file grows. The file is closed when the last
 * owner releases the stream.
 */
class artifact_stream {
public:
  /**
   * @brief Opens a stream on `location`.
   * @param location The file to read.
   * @param offset The first byte to read.
   * @param length The number of bytes the stream yields at most.
   */
  artifact_stream(const std::filesystem::path &location, std::uintmax_t offset,
                  std::uintmax_t length);

  /** @returns true if the file opened and is positioned at the offset. */
  [[nodiscard]] auto is_open() const noexcept -> bool;

  /**
   * @brief Reads the next bytes into buf.
   * @param buf The destination buffer.
   * @param[out] err Set to std::errc::io_error on a read failure.
   * @returns The number of bytes read. A short read without an error only
   * happens at the end of the stream.
   */
  auto read(std::span<char> buf, std::error_code &err) -> std::size_t;

  /** @returns The number of bytes the stream can still yield. */
  [[nodiscard]] auto remaining() const noexcept -> std::uintmax_t
  {
    return remaining_;
  }

private:
  /** @brief The underlying file. */
  std::ifstream file_;
  /** @brief Bytes left before the stream is exhausted. */
  std::uintmax_t remaining_;
};

/**
 * @brief A read-only view over the artifact directory.
 * @details The store is the only component that turns request paths into
 * filesystem paths. Every lookup re-stats the file.
 */
class artifact_store {
public:
  /**
   * @brief Creates a store rooted at `root`.
   * @param root The artifact directory.
   * @param[out] err Set if the root cannot be canonicalized.
   */
  artifact_store(const std::filesystem::path &root, std::error_code &err);

  /**
   * @brief Resolves a logical path to an artifact.
   * @param logical_path The request path, '/' separated.
   * @param[out] err Cleared on success. Set to
   * std::errc::no_such_file_or_directory if there is no regular file at the
   * path, or std::errc::permission_denied if the path escapes the root.
   * @returns The artifact, valid only if err is clear.
   */
  [[nodiscard]] auto resolve(std::string_view logical_path,
                             std::error_code &err) const -> artifact;

  /**
   * @brief Opens a byte range of a resolved artifact.
   * @param target The artifact to open.
   * @param offset The first byte of the range.
   * @param length The byte count, or std::nullopt to read to the end.
   * @param[out] err Cleared on success, set to std::errc::io_error if the
   * file can no longer be opened for reading.
   * @returns A shared stream, empty on error.
   */
  [[nodiscard]] auto open_range(const artifact &target, std::uintmax_t offset,
                                std::optional<std::uintmax_t> length,
                                std::error_code &err) const
      -> std::shared_ptr<artifact_stream>;

  /** @returns The canonical root directory. */
  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path &
  {
    return root_;
  }

  /**
   * @brief Canonicalizes a logical path without touching the filesystem.
   * @details Empty and "." segments are dropped, ".." removes the previous
   * segment. A leading '/' is ignored.
   * @param logical_path The request path.
   * @returns The canonical path, or std::nullopt if ".." climbs above the
   * root.
   */
  static auto normalize(std::string_view logical_path)
      -> std::optional<std::string>;

  /**
   * @brief Infers a MIME type from the file name.
   * @param filename The file name.
   * @returns The MIME type, application/octet-stream if unknown.
   */
  static auto content_type(const std::filesystem::path &filename)
      -> std::string_view;

private:
  /** @brief The canonical root directory. */
  std::filesystem::path root_;
};
} // namespace netboot
#endif // NETBOOT_ARTIFACT_STORE_HPP
