/*
 *    buffered_read_stream.hpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef LIGHT_READER_BUFFERED_READ_STREAM_HPP
#define LIGHT_READER_BUFFERED_READ_STREAM_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "include/light_reader/config.hpp"
#include "include/light_reader/io/stream.hpp"
#include "include/light_reader/shared_ptr.hpp"

namespace lr::io {

/*
 * A read-only stream that keeps a second level of buffering on top of a
 * seekable source, to take the per-call cost out of parsers that read a few
 * bytes at a time. Reads and seeks behave exactly as they would on the
 * source itself.
 *
 * Small reads are served from an internal buffer of kBufferLength bytes,
 * reads larger than the buffer go straight to the source, and seeks that
 * land inside the buffered window cost no I/O.
 *
 * The length of the source is captured on construction. Instances are not
 * thread safe.
 */
class LIGHT_READER_API BufferedReadStream : public IStream {
 public:
  static constexpr std::size_t kBufferLength = 8192;

  // Throws std::invalid_argument if stream is null, not readable or not
  // seekable. A writable stream is flushed first.
  explicit BufferedReadStream(IStream *stream);
  ~BufferedReadStream() noexcept override;

  BufferedReadStream(const BufferedReadStream &) = delete;
  BufferedReadStream &operator=(const BufferedReadStream &) = delete;

  auto AddRef() -> std::int64_t override;
  auto Release() -> void override;

  auto CanRead() const noexcept -> bool override;
  auto CanSeek() const noexcept -> bool override;
  auto CanWrite() const noexcept -> bool override;
  auto Length() noexcept -> std::int64_t override;
  auto Position() noexcept -> std::int64_t override;
  auto SetPosition(std::int64_t position) noexcept -> std::int64_t override;

  // Returns the next byte (0-255), kEndOfStream at the end of the stream,
  // or a negative AVERROR if the source failed.
  auto ReadByte() noexcept -> int;
  auto Read(std::uint8_t *buf, std::size_t buf_size) noexcept -> int override;
  auto Seek(std::int64_t offset, int whence) noexcept -> std::int64_t override;

  // Moves the source to the logical position and drops the buffered window.
  auto Flush() noexcept -> int override;

  // Always kErrorNotSupported.
  auto Write(const std::uint8_t *buf, std::size_t buf_size) noexcept -> int override;
  auto SetLength(std::int64_t length) noexcept -> int override;

  // Releases the buffer and the reference on the source, leaving the source
  // at the logical position. Later calls do nothing.
  auto Close() noexcept -> void;

  auto BaseStream() const noexcept -> IStream *;

 private:
  struct Window {
    std::int64_t offset;
    std::size_t filled;
  };

  auto IsInReadBuffer(std::int64_t new_position, std::int64_t &index) const noexcept -> bool;
  auto MoveTo(std::int64_t new_position) noexcept -> void;
  auto SyncBaseStream() noexcept -> int;
  auto SyncReaderPosition() noexcept -> int;
  auto FillReadBuffer() noexcept -> int;
  auto InvalidateReadBuffer() noexcept -> void;
  auto ReadToBufferViaCopyFast(std::uint8_t *buf, std::size_t count) noexcept -> int;
  auto ReadToBufferViaCopySlow(std::uint8_t *buf, std::size_t count) noexcept -> int;
  auto ReadToBufferDirectSlow(std::uint8_t *buf, std::size_t count) noexcept -> int;
  auto GetCopyCount(std::size_t count) const noexcept -> std::size_t;
  auto CopyBytes(std::uint8_t *buf, std::size_t count) const noexcept -> void;

  std::atomic<std::uint32_t> ref_count_ = {1};
  SharedPtr<IStream> stream_;
  std::int64_t length_ = 0;
  std::uint8_t *read_buffer_ = nullptr;
  // Index within read_buffer_, kBufferLength when nothing is left to read.
  std::size_t read_buffer_index_ = kBufferLength;
  // Source range held by read_buffer_, empty until the first fill.
  std::optional<Window> window_;
  // What the source position would be without buffering.
  std::int64_t reader_position_ = 0;
  bool is_disposed_ = false;
};

}  // namespace lr::io

#endif  // LIGHT_READER_BUFFERED_READ_STREAM_HPP
