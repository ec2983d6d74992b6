/*
 *    custom_io_wrapper.cpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <new>
#include <stdexcept>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

#include "src/io/custom_io_wrapper.hpp"

using namespace lr::io;

static auto ReadCallback(void *opaque, std::uint8_t *buf, int buf_size) -> int {
  auto stream = reinterpret_cast<lr::io::IStream *>(opaque);
  if (buf_size <= 0) {
    return 0;
  }
  auto ret = stream->Read(buf, static_cast<std::size_t>(buf_size));
  if (ret == 0) {
    return AVERROR_EOF;
  }
  return ret;
}

static auto SeekCallback(void *opaque, std::int64_t offset, int whence)
    -> std::int64_t {
  auto stream = reinterpret_cast<lr::io::IStream *>(opaque);
  if (whence & AVSEEK_SIZE) {
    return stream->Length();
  }
  return stream->Seek(offset, whence & ~AVSEEK_FORCE);
}

CustomIOWrapper::CustomIOWrapper(IStream *stream) : stream_(stream, true) {
  if (!stream_) {
    throw std::invalid_argument("Stream must not be null.");
  }
  constexpr int buffer_size = 16 * 1024;
  auto io_buffer = reinterpret_cast<unsigned char *>(av_malloc(buffer_size));
  if (io_buffer == nullptr) {
    throw std::bad_alloc();
  }
  int64_t (*seek_callback)(void *opaque, int64_t offset, int whence) = nullptr;
  if (stream_->CanSeek()) {
    seek_callback = &SeekCallback;
  }
  AVIOContext *io_ctx =
      avio_alloc_context(io_buffer, buffer_size, 0, stream_.get(),
                         &ReadCallback, nullptr, seek_callback);
  if (io_ctx == nullptr) {
    av_free(io_buffer);
    throw std::runtime_error("avio_alloc_context error.");
  }
  io_ctx_ = io_ctx;
}

auto CustomIOWrapper::IOContext() const -> AVIOContext * { return io_ctx_; }

CustomIOWrapper::~CustomIOWrapper() {
  if (io_ctx_ != nullptr) {
    // The context may have swapped in a buffer of its own.
    av_freep(&io_ctx_->buffer);
    avio_context_free(&io_ctx_);
  }
}
