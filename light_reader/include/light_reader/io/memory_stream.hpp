/*
 *    memory_stream.hpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef LIGHT_READER_MEMORY_STREAM_HPP
#define LIGHT_READER_MEMORY_STREAM_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "include/light_reader/config.hpp"
#include "include/light_reader/io/stream.hpp"

namespace lr::io {

// A seekable stream over a byte vector. Writes are accepted only when the
// stream is created writable.
class LIGHT_READER_API MemoryStream : public IStream {
 public:
  explicit MemoryStream(std::vector<std::uint8_t> data, bool writable = false);
  ~MemoryStream() noexcept override;

  auto AddRef() -> std::int64_t override;
  auto Release() -> void override;

  auto CanRead() const noexcept -> bool override;
  auto CanSeek() const noexcept -> bool override;
  auto CanWrite() const noexcept -> bool override;
  auto Length() noexcept -> std::int64_t override;
  auto Position() noexcept -> std::int64_t override;
  auto SetPosition(std::int64_t position) noexcept -> std::int64_t override;
  auto Read(std::uint8_t *buf, std::size_t buf_size) noexcept -> int override;
  auto Seek(std::int64_t offset, int whence) noexcept -> std::int64_t override;
  auto Flush() noexcept -> int override;
  auto Write(const std::uint8_t *buf, std::size_t buf_size) noexcept -> int override;
  auto SetLength(std::int64_t length) noexcept -> int override;

  auto Data() const noexcept -> const std::vector<std::uint8_t> &;

 private:
  std::atomic<std::uint32_t> ref_count_ = {1};
  std::vector<std::uint8_t> data_;
  // May point past the end of data_.
  std::int64_t position_ = 0;
  bool writable_ = false;
};

}  // namespace lr::io

#endif  // LIGHT_READER_MEMORY_STREAM_HPP
