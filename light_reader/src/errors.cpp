/*
 *    errors.cpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "src/errors.hpp"

#include <cerrno>

extern "C" {
#include <libavutil/error.h>
}

namespace lr {

auto ErrorToString(int errnum) -> std::string {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {};
  if (av_strerror(errnum, buf, sizeof(buf)) < 0) {
    return "Unknown error " + std::to_string(errnum);
  }
  return buf;
}

auto ErrnoToError() noexcept -> int {
  auto err = errno;
  if (err == 0) {
    return AVERROR_UNKNOWN;
  }
  return AVERROR(err);
}

}  // namespace lr
