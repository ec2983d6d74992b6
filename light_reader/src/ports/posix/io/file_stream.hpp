/*
 *    file_stream.hpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef LIGHT_READER_FILE_STREAM_HPP
#define LIGHT_READER_FILE_STREAM_HPP

#include <atomic>
#include <string>

#include "include/light_reader/io/stream.hpp"

namespace lr::ports::posix::io {

class FileStream : public lr::io::IStream {
 public:
  // Opens path read-only. Throws std::system_error on failure.
  explicit FileStream(const std::string &path);
  ~FileStream() noexcept override;

  FileStream(const FileStream &) = delete;
  FileStream &operator=(const FileStream &) = delete;

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

 private:
  std::atomic<std::uint32_t> ref_count_ = {1};
  int fd_ = -1;
};

}  // namespace lr::ports::posix::io

#endif  // LIGHT_READER_FILE_STREAM_HPP
