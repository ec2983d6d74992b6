/*
 *    file_stream.cpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include "src/ports/posix/io/file_stream.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <limits>
#include <system_error>

#include "src/errors.hpp"

using namespace lr::ports::posix::io;

FileStream::FileStream(const std::string &path) {
  int fd = -1;
  do {
    fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open " + path);
  }
  fd_ = fd;
}

FileStream::~FileStream() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

auto FileStream::AddRef() -> std::int64_t { return ++ref_count_; }

auto FileStream::Release() -> void {
  auto cnt = --ref_count_;
  if (cnt <= 0) {
    delete this;
  }
}

auto FileStream::CanRead() const noexcept -> bool { return true; }

auto FileStream::CanSeek() const noexcept -> bool { return true; }

auto FileStream::CanWrite() const noexcept -> bool { return false; }

auto FileStream::Length() noexcept -> std::int64_t {
  struct stat st {};
  if (::fstat(fd_, &st) < 0) {
    return lr::ErrnoToError();
  }
  return static_cast<std::int64_t>(st.st_size);
}

auto FileStream::Position() noexcept -> std::int64_t {
  return Seek(0, SEEK_CUR);
}

auto FileStream::SetPosition(std::int64_t position) noexcept -> std::int64_t {
  return Seek(position, SEEK_SET);
}

auto FileStream::Read(std::uint8_t *buf, std::size_t buf_size) noexcept -> int {
  auto n = std::min<std::size_t>(buf_size, std::numeric_limits<int>::max());
  ssize_t ret = 0;
  do {
    ret = ::read(fd_, buf, n);
  } while (ret < 0 && errno == EINTR);
  if (ret < 0) {
    return lr::ErrnoToError();
  }
  return static_cast<int>(ret);
}

auto FileStream::Seek(std::int64_t offset, int whence) noexcept -> std::int64_t {
  auto ret = ::lseek(fd_, static_cast<off_t>(offset), whence);
  if (ret < 0) {
    return lr::ErrnoToError();
  }
  return static_cast<std::int64_t>(ret);
}

auto FileStream::Flush() noexcept -> int { return 0; }

auto FileStream::Write(const std::uint8_t *, std::size_t) noexcept -> int {
  return lr::io::kErrorNotSupported;
}

auto FileStream::SetLength(std::int64_t) noexcept -> int {
  return lr::io::kErrorNotSupported;
}
