/*
 *    memory_stream.cpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "include/light_reader/io/memory_stream.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <exception>
#include <limits>
#include <utility>

using namespace lr::io;

MemoryStream::MemoryStream(std::vector<std::uint8_t> data, bool writable)
    : data_(std::move(data)), writable_(writable) {}

MemoryStream::~MemoryStream() noexcept {}

auto MemoryStream::AddRef() -> std::int64_t { return ++ref_count_; }

auto MemoryStream::Release() -> void {
  auto cnt = --ref_count_;
  if (cnt <= 0) {
    delete this;
  }
}

auto MemoryStream::CanRead() const noexcept -> bool { return true; }

auto MemoryStream::CanSeek() const noexcept -> bool { return true; }

auto MemoryStream::CanWrite() const noexcept -> bool { return writable_; }

auto MemoryStream::Length() noexcept -> std::int64_t {
  return static_cast<std::int64_t>(data_.size());
}

auto MemoryStream::Position() noexcept -> std::int64_t { return position_; }

auto MemoryStream::SetPosition(std::int64_t position) noexcept -> std::int64_t {
  if (position < 0) {
    return AVERROR(EINVAL);
  }
  position_ = position;
  return position_;
}

auto MemoryStream::Read(std::uint8_t *buf, std::size_t buf_size) noexcept
    -> int {
  auto size = static_cast<std::int64_t>(data_.size());
  if (position_ >= size || buf_size == 0) {
    return 0;
  }
  auto n = std::min<std::size_t>({buf_size,
                                   static_cast<std::size_t>(size - position_),
                                   std::numeric_limits<int>::max()});
  std::memcpy(buf, data_.data() + position_, n);
  position_ += static_cast<std::int64_t>(n);
  return static_cast<int>(n);
}

auto MemoryStream::Seek(std::int64_t offset, int whence) noexcept
    -> std::int64_t {
  std::int64_t base = 0;
  switch (whence) {
    case SEEK_SET:
      return SetPosition(offset);
    case SEEK_CUR:
      base = position_;
      break;
    case SEEK_END:
      base = static_cast<std::int64_t>(data_.size());
      break;
    default:
      return AVERROR(EINVAL);
  }
  // base + offset must stay representable.
  if ((offset > 0 && base > std::numeric_limits<std::int64_t>::max() - offset) ||
      (offset < 0 && base < std::numeric_limits<std::int64_t>::min() - offset)) {
    return AVERROR(EINVAL);
  }
  return SetPosition(base + offset);
}

auto MemoryStream::Flush() noexcept -> int { return 0; }

auto MemoryStream::Write(const std::uint8_t *buf, std::size_t buf_size) noexcept
    -> int {
  if (!writable_) {
    return kErrorNotSupported;
  }
  auto n = std::min<std::size_t>(buf_size, std::numeric_limits<int>::max());
  if (n == 0) {
    return 0;
  }
  auto end = static_cast<std::size_t>(position_) + n;
  try {
    if (end > data_.size()) {
      data_.resize(end);
    }
  } catch (const std::exception &) {
    return AVERROR(ENOMEM);
  }
  std::memcpy(data_.data() + position_, buf, n);
  position_ += static_cast<std::int64_t>(n);
  return static_cast<int>(n);
}

auto MemoryStream::SetLength(std::int64_t length) noexcept -> int {
  if (!writable_) {
    return kErrorNotSupported;
  }
  if (length < 0) {
    return AVERROR(EINVAL);
  }
  try {
    data_.resize(static_cast<std::size_t>(length));
  } catch (const std::exception &) {
    return AVERROR(ENOMEM);
  }
  position_ = std::min(position_, length);
  return 0;
}

auto MemoryStream::Data() const noexcept -> const std::vector<std::uint8_t> & {
  return data_;
}
