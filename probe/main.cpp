/*
 *    main.cpp:
 *
 *    Copyright (C) 2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#include <cstdio>
#include <cstring>
#include <exception>
#include <string>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/log.h>
}

#include "include/light_reader/io/buffered_read_stream.hpp"
#include "include/light_reader/shared_ptr.hpp"
#include "src/errors.hpp"
#include "src/io/custom_io_wrapper.hpp"
#include "src/ports/posix/io/file_stream.hpp"

static auto PrintUsage(const char *argv0) -> void {
  std::fprintf(stderr, "usage: %s [-q] [-v] <file>\n", argv0);
  std::fprintf(stderr, "  -q  only log errors\n");
  std::fprintf(stderr, "  -v  log every buffer fill and direct read\n");
}

static auto Probe(const std::string &path) -> int {
  auto file = lr::SharedPtr<lr::io::IStream>(
      new lr::ports::posix::io::FileStream(path), false);
  auto reader = lr::MakeShared<lr::io::BufferedReadStream>(file.get());
  lr::io::CustomIOWrapper custom_io(reader.get());

  AVFormatContext *format_ctx = avformat_alloc_context();
  if (format_ctx == nullptr) {
    av_log(nullptr, AV_LOG_ERROR, "avformat_alloc_context error.\n");
    return 2;
  }
  format_ctx->pb = custom_io.IOContext();
  format_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

  // avformat_open_input frees the context on failure.
  auto ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    av_log(nullptr, AV_LOG_ERROR, "%s: %s\n", path.c_str(),
           lr::ErrorToString(ret).c_str());
    return 2;
  }
  ret = avformat_find_stream_info(format_ctx, nullptr);
  if (ret < 0) {
    av_log(nullptr, AV_LOG_ERROR, "%s: %s\n", path.c_str(),
           lr::ErrorToString(ret).c_str());
    avformat_close_input(&format_ctx);
    return 2;
  }

  av_dump_format(format_ctx, 0, path.c_str(), 0);
  av_log(nullptr, AV_LOG_INFO, "read %lld of %lld bytes\n",
         static_cast<long long>(reader->Position()),
         static_cast<long long>(reader->Length()));

  avformat_close_input(&format_ctx);
  reader->Close();
  return 0;
}

int main(int argc, char *argv[]) {
  int log_level = AV_LOG_INFO;
  const char *path = nullptr;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-q") == 0) {
      log_level = AV_LOG_ERROR;
    } else if (std::strcmp(argv[i], "-v") == 0) {
      log_level = AV_LOG_TRACE;
    } else if (argv[i][0] == '-' || path != nullptr) {
      PrintUsage(argv[0]);
      return 1;
    } else {
      path = argv[i];
    }
  }
  if (path == nullptr) {
    PrintUsage(argv[0]);
    return 1;
  }
  av_log_set_level(log_level);

  try {
    return Probe(path);
  } catch (const std::exception &e) {
    av_log(nullptr, AV_LOG_ERROR, "%s\n", e.what());
    return 2;
  }
}
