/*
 *    buffered_read_stream.cpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "include/light_reader/io/buffered_read_stream.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <limits>
#include <new>
#include <stdexcept>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/mem.h>
}

#include "src/errors.hpp"

using namespace lr::io;

static constexpr std::size_t kMaxReadSize = std::numeric_limits<int>::max();

static auto AddsWithoutOverflow(std::int64_t a, std::int64_t b) noexcept
    -> bool {
  if (b > 0) {
    return a <= std::numeric_limits<std::int64_t>::max() - b;
  }
  return a >= std::numeric_limits<std::int64_t>::min() - b;
}

static auto LogSourceError(int level, const char *what, int errnum) noexcept
    -> void {
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {};
  av_strerror(errnum, errbuf, sizeof(errbuf));
  av_log(nullptr, level, "BufferedReadStream: %s: %s\n", what, errbuf);
}

BufferedReadStream::BufferedReadStream(IStream *stream) : stream_(stream, true) {
  if (!stream_) {
    throw std::invalid_argument("Stream must not be null.");
  }
  if (!stream_->CanRead()) {
    throw std::invalid_argument("Stream must be readable.");
  }
  if (!stream_->CanSeek()) {
    throw std::invalid_argument("Stream must be seekable.");
  }

  // Anything still sitting in the source's write buffers has to land before
  // we start reading.
  if (stream_->CanWrite()) {
    auto ret = stream_->Flush();
    if (ret < 0) {
      throw std::runtime_error("flush stream error: " + ErrorToString(ret));
    }
  }

  auto position = stream_->Position();
  if (position < 0) {
    throw std::runtime_error("get stream position error: " +
                             ErrorToString(static_cast<int>(position)));
  }
  auto length = stream_->Length();
  if (length < 0) {
    throw std::runtime_error("get stream length error: " +
                             ErrorToString(static_cast<int>(length)));
  }

  read_buffer_ = reinterpret_cast<std::uint8_t *>(av_malloc(kBufferLength));
  if (read_buffer_ == nullptr) {
    throw std::bad_alloc();
  }
  reader_position_ = position;
  length_ = length;

  av_log(nullptr, AV_LOG_DEBUG,
         "BufferedReadStream: position %" PRId64 ", length %" PRId64 "\n",
         reader_position_, length_);
}

BufferedReadStream::~BufferedReadStream() noexcept { Close(); }

auto BufferedReadStream::AddRef() -> std::int64_t { return ++ref_count_; }

auto BufferedReadStream::Release() -> void {
  auto cnt = --ref_count_;
  if (cnt <= 0) {
    delete this;
  }
}

auto BufferedReadStream::CanRead() const noexcept -> bool { return true; }

auto BufferedReadStream::CanSeek() const noexcept -> bool { return true; }

auto BufferedReadStream::CanWrite() const noexcept -> bool { return false; }

auto BufferedReadStream::Length() noexcept -> std::int64_t { return length_; }

auto BufferedReadStream::Position() noexcept -> std::int64_t {
  return reader_position_;
}

auto BufferedReadStream::SetPosition(std::int64_t position) noexcept
    -> std::int64_t {
  if (is_disposed_) {
    return AVERROR(EBADF);
  }
  // Inside the working buffer only the index moves.
  std::int64_t index = 0;
  if (IsInReadBuffer(position, index)) {
    read_buffer_index_ = static_cast<std::size_t>(index);
    reader_position_ = position;
    return reader_position_;
  }

  // The source rejects invalid positions for us.
  auto ret = stream_->Seek(position, SEEK_SET);
  if (ret < 0) {
    return ret;
  }
  reader_position_ = position;
  InvalidateReadBuffer();
  return reader_position_;
}

auto BufferedReadStream::ReadByte() noexcept -> int {
  if (is_disposed_) {
    return AVERROR(EBADF);
  }
  if (reader_position_ >= length_) {
    return kEndOfStream;
  }

  // Our buffer has been read, refill and start again.
  if (!window_ || read_buffer_index_ >= window_->filled) {
    auto ret = FillReadBuffer();
    if (ret < 0) {
      return ret;
    }
    if (read_buffer_index_ >= window_->filled) {
      return kEndOfStream;
    }
  }

  ++reader_position_;
  return read_buffer_[read_buffer_index_++];
}

auto BufferedReadStream::Read(std::uint8_t *buf, std::size_t buf_size) noexcept
    -> int {
  if (is_disposed_) {
    return AVERROR(EBADF);
  }
  auto count = std::min(buf_size, kMaxReadSize);

  // Too big for our buffer, read directly from the stream.
  if (count > kBufferLength) {
    return ReadToBufferDirectSlow(buf, count);
  }

  // Nothing left in the window, refill on the same condition as ReadByte.
  if (count > 0 && (!window_ || read_buffer_index_ >= window_->filled)) {
    return ReadToBufferViaCopySlow(buf, count);
  }

  // Too big for what is left in the buffer but not for the whole buffer,
  // refill then copy from there.
  if (count + read_buffer_index_ > kBufferLength) {
    return ReadToBufferViaCopySlow(buf, count);
  }

  return ReadToBufferViaCopyFast(buf, count);
}

auto BufferedReadStream::Seek(std::int64_t offset, int whence) noexcept
    -> std::int64_t {
  if (is_disposed_) {
    return AVERROR(EBADF);
  }
  std::int64_t base = 0;
  switch (whence) {
    case SEEK_SET:
      return SetPosition(offset);
    case SEEK_CUR:
      base = reader_position_;
      break;
    case SEEK_END:
      base = length_;
      break;
    default:
      return AVERROR(EINVAL);
  }
  if (!AddsWithoutOverflow(base, offset)) {
    return AVERROR(EINVAL);
  }
  return SetPosition(base + offset);
}

auto BufferedReadStream::Flush() noexcept -> int {
  if (is_disposed_) {
    return AVERROR(EBADF);
  }
  return SyncReaderPosition();
}

auto BufferedReadStream::Write(const std::uint8_t *, std::size_t) noexcept
    -> int {
  return kErrorNotSupported;
}

auto BufferedReadStream::SetLength(std::int64_t) noexcept -> int {
  return kErrorNotSupported;
}

auto BufferedReadStream::Close() noexcept -> void {
  if (is_disposed_) {
    return;
  }
  is_disposed_ = true;
  av_freep(&read_buffer_);
  InvalidateReadBuffer();
  auto ret = SyncReaderPosition();
  if (ret < 0) {
    LogSourceError(AV_LOG_WARNING, "restore source position failed", ret);
  }
  stream_.reset();
}

auto BufferedReadStream::BaseStream() const noexcept -> IStream * {
  return stream_.get();
}

auto BufferedReadStream::IsInReadBuffer(std::int64_t new_position,
                                        std::int64_t &index) const noexcept
    -> bool {
  if (!window_ || new_position < window_->offset) {
    return false;
  }
  // Same as new_position - reader_position_ + read_buffer_index_.
  index = new_position - window_->offset;
  return index < static_cast<std::int64_t>(kBufferLength);
}

auto BufferedReadStream::MoveTo(std::int64_t new_position) noexcept -> void {
  std::int64_t index = 0;
  if (IsInReadBuffer(new_position, index)) {
    read_buffer_index_ = static_cast<std::size_t>(index);
  } else {
    InvalidateReadBuffer();
  }
  reader_position_ = new_position;
}

auto BufferedReadStream::SyncBaseStream() noexcept -> int {
  auto position = stream_->Position();
  if (position < 0) {
    return static_cast<int>(position);
  }
  if (position != reader_position_) {
    auto ret = stream_->Seek(reader_position_, SEEK_SET);
    if (ret < 0) {
      return static_cast<int>(ret);
    }
  }
  return 0;
}

auto BufferedReadStream::SyncReaderPosition() noexcept -> int {
  auto position = stream_->Position();
  if (position < 0) {
    return static_cast<int>(position);
  }
  if (position != reader_position_) {
    auto ret = stream_->Seek(reader_position_, SEEK_SET);
    if (ret < 0) {
      return static_cast<int>(ret);
    }
    reader_position_ = ret;
  }

  // Trigger a full read on the next attempt.
  InvalidateReadBuffer();
  return 0;
}

auto BufferedReadStream::FillReadBuffer() noexcept -> int {
  // Nothing past the captured length is ever served, so don't ask for it.
  auto wanted = static_cast<std::size_t>(std::clamp<std::int64_t>(
      length_ - reader_position_, 0, static_cast<std::int64_t>(kBufferLength)));

  std::size_t n = 0;
  if (wanted > 0) {
    auto ret = SyncBaseStream();
    if (ret < 0) {
      InvalidateReadBuffer();
      return ret;
    }

    // Read doesn't always return the full request, keep going until we have
    // what we asked for or hit the end of the stream.
    int i = 0;
    do {
      i = stream_->Read(read_buffer_ + n, wanted - n);
      if (i < 0) {
        if (n == 0) {
          InvalidateReadBuffer();
          return i;
        }
        LogSourceError(AV_LOG_WARNING, "short fill", i);
        break;
      }
      n += static_cast<std::size_t>(i);
    } while (n < wanted && i > 0);
  }

  av_log(nullptr, AV_LOG_TRACE,
         "BufferedReadStream: fill %zu bytes at %" PRId64 "\n", n,
         reader_position_);

  window_ = Window{reader_position_, n};
  read_buffer_index_ = 0;
  return 0;
}

auto BufferedReadStream::InvalidateReadBuffer() noexcept -> void {
  window_.reset();
  read_buffer_index_ = kBufferLength;
}

auto BufferedReadStream::ReadToBufferViaCopyFast(std::uint8_t *buf,
                                                 std::size_t count) noexcept
    -> int {
  auto n = GetCopyCount(count);
  CopyBytes(buf, n);

  reader_position_ += static_cast<std::int64_t>(n);
  read_buffer_index_ += n;

  return static_cast<int>(n);
}

auto BufferedReadStream::ReadToBufferViaCopySlow(std::uint8_t *buf,
                                                 std::size_t count) noexcept
    -> int {
  auto ret = FillReadBuffer();
  if (ret < 0) {
    return ret;
  }
  return ReadToBufferViaCopyFast(buf, count);
}

auto BufferedReadStream::ReadToBufferDirectSlow(std::uint8_t *buf,
                                                std::size_t count) noexcept
    -> int {
  auto remaining = length_ - reader_position_;
  if (remaining <= 0) {
    return 0;
  }
  if (static_cast<std::uint64_t>(remaining) < count) {
    count = static_cast<std::size_t>(remaining);
  }

  // Read to target but don't copy to our read buffer.
  auto ret = SyncBaseStream();
  if (ret < 0) {
    return ret;
  }

  std::size_t n = 0;
  int i = 0;
  do {
    i = stream_->Read(buf + n, count - n);
    if (i < 0) {
      if (n == 0) {
        return i;
      }
      LogSourceError(AV_LOG_WARNING, "short direct read", i);
      break;
    }
    n += static_cast<std::size_t>(i);
  } while (n < count && i > 0);

  av_log(nullptr, AV_LOG_TRACE,
         "BufferedReadStream: direct read %zu bytes at %" PRId64 "\n", n,
         reader_position_);

  MoveTo(reader_position_ + static_cast<std::int64_t>(n));
  return static_cast<int>(n);
}

auto BufferedReadStream::GetCopyCount(std::size_t count) const noexcept
    -> std::size_t {
  auto remaining = length_ - reader_position_;
  if (remaining <= 0 || !window_ || read_buffer_index_ >= window_->filled) {
    return 0;
  }
  auto n = window_->filled - read_buffer_index_;
  if (static_cast<std::uint64_t>(remaining) < n) {
    n = static_cast<std::size_t>(remaining);
  }
  return std::min(count, n);
}

auto BufferedReadStream::CopyBytes(std::uint8_t *buf, std::size_t count) const noexcept
    -> void {
  const auto *src = read_buffer_ + read_buffer_index_;
  if (count < LIGHT_READER_SMALL_COPY_THRESHOLD) {
    for (std::size_t i = 0; i < count; ++i) {
      buf[i] = src[i];
    }
  } else {
    std::memcpy(buf, src, count);
  }
}
