/*
 *    stream.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef LIGHT_READER_STREAM_HPP
#define LIGHT_READER_STREAM_HPP

#include <cerrno>
#include <cstddef>
#include <cstdint>

extern "C" {
#include <libavutil/error.h>
}

#include "include/light_reader/config.hpp"
#include "include/light_reader/ref_counted.hpp"

namespace lr::io {

// Returned by single byte reads once the stream is exhausted.
inline constexpr int kEndOfStream = AVERROR_EOF;

// Returned by operations a stream does not implement.
inline constexpr int kErrorNotSupported = AVERROR(ENOSYS);

// A blocking byte stream. Failures are reported as negative AVERROR codes.
// Seek takes SEEK_SET, SEEK_CUR or SEEK_END.
class LIGHT_READER_API IStream
    : public RefCounted {
 public:
  virtual ~IStream() noexcept {}
  virtual auto CanRead() const noexcept -> bool = 0;
  virtual auto CanSeek() const noexcept -> bool = 0;
  virtual auto CanWrite() const noexcept -> bool = 0;
  virtual auto Length() noexcept -> std::int64_t = 0;
  virtual auto Position() noexcept -> std::int64_t = 0;
  virtual auto SetPosition(std::int64_t position) noexcept -> std::int64_t = 0;
  // Returns the number of bytes read, which may be less than buf_size.
  // Zero means the stream is exhausted.
  virtual auto Read(std::uint8_t *buf, std::size_t buf_size) noexcept -> int = 0;
  virtual auto Seek(std::int64_t offset, int whence) noexcept -> std::int64_t = 0;
  virtual auto Flush() noexcept -> int = 0;
  virtual auto Write(const std::uint8_t *buf, std::size_t buf_size) noexcept -> int = 0;
  virtual auto SetLength(std::int64_t length) noexcept -> int = 0;
};

}  // namespace lr::io

#endif  // LIGHT_READER_STREAM_HPP
