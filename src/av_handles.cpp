/**
 * @file av_handles.cpp
 * @brief RAII owners for FFmpeg objects
 */

#include "snapmerge/av_handles.hpp"

namespace snapmerge {

std::string av_error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  if (av_strerror(errnum, buf, sizeof(buf)) < 0) {
    return "unknown FFmpeg error " + std::to_string(errnum);
  }
  return buf;
}

InputFile::~InputFile() {
  if (ctx_) {
    avformat_close_input(&ctx_);
  }
}

int InputFile::open(const std::filesystem::path &path) {
  if (ctx_) {
    avformat_close_input(&ctx_);
  }

  /// Passing no input format lets the demuxers probe the content
  int ret = avformat_open_input(&ctx_, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    ctx_ = nullptr;
    return ret;
  }

  ret = avformat_find_stream_info(ctx_, nullptr);
  if (ret < 0) {
    avformat_close_input(&ctx_);
    return ret;
  }
  return 0;
}

} // namespace snapmerge
