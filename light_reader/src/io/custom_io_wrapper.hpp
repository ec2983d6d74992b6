/*
 *    custom_io_wrapper.hpp:
 *
 *    Copyright (C) 2025-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef LIGHT_READER_CUSTOM_IO_WRAPPER_HPP
#define LIGHT_READER_CUSTOM_IO_WRAPPER_HPP

extern "C" {
#include <libavformat/avio.h>
}

#include "include/light_reader/io/stream.hpp"
#include "include/light_reader/shared_ptr.hpp"

namespace lr::io {

// Exposes an IStream as a read-only AVIOContext for libavformat.
class CustomIOWrapper {
 public:
  explicit CustomIOWrapper(IStream *stream);
  ~CustomIOWrapper();

  CustomIOWrapper(const CustomIOWrapper &) = delete;
  CustomIOWrapper &operator=(const CustomIOWrapper &) = delete;

  auto IOContext() const -> AVIOContext *;

 private:
  SharedPtr<IStream> stream_;
  AVIOContext *io_ctx_ = nullptr;
};

}  // namespace lr::io

#endif  // LIGHT_READER_CUSTOM_IO_WRAPPER_HPP
