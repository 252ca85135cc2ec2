/**
 * @file av_handles.hpp
 * @brief RAII owners for FFmpeg objects
 *
 * @details FFmpeg hands out raw pointers that must be released with a
 *          matching *_free / *_close call. These wrappers give every probe
 *          and codec call a scope-bound lifetime so no file handle outlives
 *          the function that opened it.
 *
 *          - InputFile: avformat_open_input / avformat_close_input
 *
 *          - CodecContext: avcodec_alloc_context3 / avcodec_free_context
 *
 *          - Frame, Packet: av_frame_alloc / av_packet_alloc
 *
 *          - ScaleContext: sws_getContext / sws_freeContext
 */

#ifndef SNAPMERGE_AV_HANDLES_HPP
#define SNAPMERGE_AV_HANDLES_HPP

#include <filesystem>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

namespace snapmerge {

/**
 * @brief Human-readable text for an FFmpeg error code.
 */
std::string av_error_string(int errnum);

/**
 * @class InputFile
 * @brief Demuxer context opened on a file, probed by content.
 */
class InputFile {
public:
  InputFile() = default;
  ~InputFile();

  InputFile(const InputFile &) = delete;
  InputFile &operator=(const InputFile &) = delete;

  /**
   * @brief Open and probe a file.
   * @param path File to open
   * @return 0 on success, negative AVERROR code otherwise
   * @note Reads stream info as well; on failure the object stays empty.
   */
  int open(const std::filesystem::path &path);

  AVFormatContext *get() const { return ctx_; }
  AVFormatContext *operator->() const { return ctx_; }
  explicit operator bool() const { return ctx_ != nullptr; }

private:
  AVFormatContext *ctx_{nullptr};
};

class CodecContext {
public:
  explicit CodecContext(const AVCodec *codec)
      : ctx_(avcodec_alloc_context3(codec)) {}
  ~CodecContext() { avcodec_free_context(&ctx_); }

  CodecContext(const CodecContext &) = delete;
  CodecContext &operator=(const CodecContext &) = delete;

  AVCodecContext *get() const { return ctx_; }
  AVCodecContext *operator->() const { return ctx_; }
  explicit operator bool() const { return ctx_ != nullptr; }

private:
  AVCodecContext *ctx_;
};

class Frame {
public:
  Frame() : frame_(av_frame_alloc()) {}
  ~Frame() { av_frame_free(&frame_); }

  Frame(const Frame &) = delete;
  Frame &operator=(const Frame &) = delete;

  AVFrame *get() const { return frame_; }
  AVFrame *operator->() const { return frame_; }
  explicit operator bool() const { return frame_ != nullptr; }

private:
  AVFrame *frame_;
};

class Packet {
public:
  Packet() : pkt_(av_packet_alloc()) {}
  ~Packet() { av_packet_free(&pkt_); }

  Packet(const Packet &) = delete;
  Packet &operator=(const Packet &) = delete;

  AVPacket *get() const { return pkt_; }
  AVPacket *operator->() const { return pkt_; }
  explicit operator bool() const { return pkt_ != nullptr; }

private:
  AVPacket *pkt_;
};

class ScaleContext {
public:
  ScaleContext(int src_w, int src_h, AVPixelFormat src_fmt, int dst_w,
               int dst_h, AVPixelFormat dst_fmt, int flags)
      : ctx_(sws_getContext(src_w, src_h, src_fmt, dst_w, dst_h, dst_fmt,
                            flags, nullptr, nullptr, nullptr)) {}
  ~ScaleContext() { sws_freeContext(ctx_); }

  ScaleContext(const ScaleContext &) = delete;
  ScaleContext &operator=(const ScaleContext &) = delete;

  SwsContext *get() const { return ctx_; }
  explicit operator bool() const { return ctx_ != nullptr; }

private:
  SwsContext *ctx_;
};

} // namespace snapmerge

#endif // SNAPMERGE_AV_HANDLES_HPP
