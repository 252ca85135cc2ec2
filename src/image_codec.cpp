/**
 * @file image_codec.cpp
 * @brief Still-image decode, resize, alpha composite and encode
 *        implementation
 *
 * @details Decoding uses the same demuxer probing as the classifier, then
 *          the stream's decoder; libswscale converts whatever pixel format
 *          comes out (YUVJ, PAL8, RGB48, ...) to packed RGBA. Encoding feeds
 *          one frame to the format's still encoder and keeps the single
 *          packet it produces, which is the complete file.
 */

#include "snapmerge/image_codec.hpp"

#include <algorithm>
#include <string>

#include <fmt/core.h>

#include "snapmerge/av_handles.hpp"
#include "snapmerge/config.hpp"
#include "snapmerge/errors.hpp"
#include "snapmerge/logging.hpp"
#include "snapmerge/media_probe.hpp"

namespace snapmerge {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

constexpr int SCALE_FLAGS = SWS_BICUBIC | SWS_ACCURATE_RND | SWS_FULL_CHR_H_INT;

/// "path: " message prefix, empty when no source file is known
std::string prefix(const fs::path &source) {
  return source.empty() ? std::string() : source.string() + ": ";
}

bool has_transparency(const RgbaImage &image) {
  const size_t n = static_cast<size_t>(image.width) * image.height;
  for (size_t i = 0; i < n; ++i) {
    if (image.pixels[i * RGBA_CHANNELS + 3] != 255)
      return true;
  }
  return false;
}

struct EncoderSpec {
  AVCodecID codec;
  AVPixelFormat pix_fmt;
};

EncoderSpec encoder_for(const std::string &format_name) {
  if (format_name == "jpeg")
    return {AV_CODEC_ID_MJPEG, AV_PIX_FMT_YUVJ420P};
  if (format_name == "bmp")
    return {AV_CODEC_ID_BMP, AV_PIX_FMT_BGR24};
  if (format_name == "tiff")
    return {AV_CODEC_ID_TIFF, AV_PIX_FMT_RGB24};
  return {AV_CODEC_ID_PNG, AV_PIX_FMT_RGB24};
}

/// Convert a decoded frame of any pixel format to packed RGBA
RgbaImage frame_to_rgba(const AVFrame *frame, const fs::path &path) {
  RgbaImage out(frame->width, frame->height);

  ScaleContext sws(frame->width, frame->height,
                   static_cast<AVPixelFormat>(frame->format), frame->width,
                   frame->height, AV_PIX_FMT_RGBA, SCALE_FLAGS);
  if (!sws) {
    throw CodecError(fmt::format("{}: unsupported pixel format {}",
                                 path.string(), frame->format),
                     path);
  }

  uint8_t *dst[4] = {out.pixels.data(), nullptr, nullptr, nullptr};
  int dst_stride[4] = {out.width * RGBA_CHANNELS, 0, 0, 0};
  if (sws_scale(sws.get(), frame->data, frame->linesize, 0, frame->height, dst,
                dst_stride) <= 0) {
    throw CodecError(
        fmt::format("{}: pixel format conversion failed", path.string()),
        path);
  }
  return out;
}

/// Pull one frame out of the decoder, feeding packets as needed
bool decode_first_frame(AVFormatContext *fmt_ctx, AVCodecContext *dec,
                        int stream_idx, AVFrame *frame,
                        const fs::path &path) {
  Packet pkt;
  if (!pkt) {
    throw CodecError(fmt::format("{}: out of memory", path.string()), path);
  }

  while (av_read_frame(fmt_ctx, pkt.get()) >= 0) {
    if (pkt->stream_index != stream_idx) {
      av_packet_unref(pkt.get());
      continue;
    }
    int ret = avcodec_send_packet(dec, pkt.get());
    av_packet_unref(pkt.get());
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      throw CodecError(fmt::format("{}: decode failed: {}", path.string(),
                                   av_error_string(ret)),
                       path);
    }
    ret = avcodec_receive_frame(dec, frame);
    if (ret == 0)
      return true;
    if (ret != AVERROR(EAGAIN)) {
      throw CodecError(fmt::format("{}: decode failed: {}", path.string(),
                                   av_error_string(ret)),
                       path);
    }
  }

  /// Drain decoders that buffer a packet before emitting a frame
  avcodec_send_packet(dec, nullptr);
  return avcodec_receive_frame(dec, frame) == 0;
}

} // anonymous namespace

// **---- Decode ----**

RgbaImage decode_image(const fs::path &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw NotFoundError(fmt::format("{}: image not found", path.string()),
                        path);
  }

  InputFile input;
  int ret = input.open(path);
  if (ret < 0) {
    throw CodecError(fmt::format("{}: cannot open image: {}", path.string(),
                                 av_error_string(ret)),
                     path);
  }

  int idx = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1,
                                nullptr, 0);
  if (idx < 0) {
    throw CodecError(fmt::format("{}: no image stream", path.string()), path);
  }

  const AVCodecParameters *par = input->streams[idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(par->codec_id);
  if (!codec) {
    throw CodecError(fmt::format("{}: no decoder for codec {}", path.string(),
                                 avcodec_get_name(par->codec_id)),
                     path);
  }

  CodecContext dec(codec);
  if (!dec || avcodec_parameters_to_context(dec.get(), par) < 0) {
    throw CodecError(
        fmt::format("{}: cannot set up decoder", path.string()), path);
  }
  dec->thread_count = 1;

  ret = avcodec_open2(dec.get(), codec, nullptr);
  if (ret < 0) {
    throw CodecError(fmt::format("{}: cannot open decoder: {}", path.string(),
                                 av_error_string(ret)),
                     path);
  }

  Frame frame;
  if (!frame ||
      !decode_first_frame(input.get(), dec.get(), idx, frame.get(), path)) {
    throw CodecError(
        fmt::format("{}: no frame could be decoded", path.string()), path);
  }

  return frame_to_rgba(frame.get(), path);
}

// **---- Resize ----**

RgbaImage resize_image(const RgbaImage &src, int width, int height,
                       const fs::path &source) {
  if (width <= 0 || height <= 0 || src.width <= 0 || src.height <= 0) {
    throw InvalidArgumentError(
        fmt::format("{}cannot resize {}x{} image to {}x{}", prefix(source),
                    src.width, src.height, width, height),
        source);
  }
  if (src.width == width && src.height == height) {
    return src;
  }

  ScaleContext sws(src.width, src.height, AV_PIX_FMT_RGBA, width, height,
                   AV_PIX_FMT_RGBA, SCALE_FLAGS);
  if (!sws) {
    throw CodecError(
        fmt::format("{}cannot create scaling context", prefix(source)), source);
  }

  RgbaImage out(width, height);
  const uint8_t *src_data[4] = {src.pixels.data(), nullptr, nullptr, nullptr};
  int src_stride[4] = {src.width * RGBA_CHANNELS, 0, 0, 0};
  uint8_t *dst_data[4] = {out.pixels.data(), nullptr, nullptr, nullptr};
  int dst_stride[4] = {width * RGBA_CHANNELS, 0, 0, 0};

  if (sws_scale(sws.get(), src_data, src_stride, 0, src.height, dst_data,
                dst_stride) <= 0) {
    throw CodecError(fmt::format("{}image resize failed", prefix(source)),
                     source);
  }
  return out;
}

// **---- Composite ----**

void alpha_composite(RgbaImage &base, const RgbaImage &overlay,
                     const fs::path &source) {
  if (base.width != overlay.width || base.height != overlay.height) {
    throw InvalidArgumentError(
        fmt::format("{}overlay size mismatch: base {}x{}, overlay {}x{}",
                    prefix(source), base.width, base.height, overlay.width,
                    overlay.height),
        source);
  }

  const size_t n = static_cast<size_t>(base.width) * base.height;
  uint8_t *b = base.pixels.data();
  const uint8_t *o = overlay.pixels.data();

  for (size_t i = 0; i < n; ++i, b += RGBA_CHANNELS, o += RGBA_CHANNELS) {
    const float src_a = o[3] / 255.0f;
    if (src_a <= 0.0f)
      continue;
    const float dst_a = b[3] / 255.0f;
    const float out_a = src_a + dst_a * (1.0f - src_a);

    for (int c = 0; c < 3; ++c) {
      float v = (o[c] * src_a + b[c] * dst_a * (1.0f - src_a)) / out_a;
      b[c] = static_cast<uint8_t>(std::clamp(v + 0.5f, 0.0f, 255.0f));
    }
    b[3] = static_cast<uint8_t>(std::clamp(out_a * 255.0f + 0.5f, 0.0f, 255.0f));
  }
}

// **---- Encode ----**

ImageFormat encodable_format(const ImageFormat &requested) {
  if (requested.name == "jpeg" || requested.name == "png" ||
      requested.name == "bmp" || requested.name == "tiff") {
    return requested;
  }
  return *image_format_by_name("png");
}

EncodedImage encode_image(const RgbaImage &image, const ImageFormat &format,
                          const fs::path &source) {
  EncodedImage result;
  result.format = encodable_format(format);
  if (result.format.name != format.name) {
    LOG_DEBUG("No still encoder for {}, writing {} instead", format.name,
              result.format.name);
  }

  EncoderSpec spec = encoder_for(result.format.name);
  if (spec.codec == AV_CODEC_ID_PNG && has_transparency(image)) {
    spec.pix_fmt = AV_PIX_FMT_RGBA;
  }
  const AVCodec *codec = avcodec_find_encoder(spec.codec);
  if (!codec) {
    throw CodecError(
        fmt::format("{}no {} encoder available in this FFmpeg build",
                    prefix(source), result.format.name),
        source);
  }

  CodecContext enc(codec);
  if (!enc) {
    throw CodecError(
        fmt::format("{}cannot allocate encoder context", prefix(source)),
        source);
  }
  enc->width = image.width;
  enc->height = image.height;
  enc->pix_fmt = spec.pix_fmt;
  enc->time_base = AVRational{1, 1};
  if (spec.codec == AV_CODEC_ID_MJPEG) {
    enc->flags |= AV_CODEC_FLAG_QSCALE;
    enc->global_quality = FF_QP2LAMBDA * Config::jpeg_qscale();
    enc->color_range = AVCOL_RANGE_JPEG;
  }

  int ret = avcodec_open2(enc.get(), codec, nullptr);
  if (ret < 0) {
    throw CodecError(fmt::format("{}cannot open {} encoder: {}", prefix(source),
                                 result.format.name, av_error_string(ret)),
                     source);
  }

  Frame frame;
  if (!frame) {
    throw CodecError(
        fmt::format("{}cannot allocate frame", prefix(source)), source);
  }
  frame->format = spec.pix_fmt;
  frame->width = image.width;
  frame->height = image.height;
  frame->pts = 0;
  frame->quality = enc->global_quality;
  if (av_frame_get_buffer(frame.get(), 0) < 0) {
    throw CodecError(
        fmt::format("{}cannot allocate frame buffer", prefix(source)), source);
  }

  /// RGBA -> target format; alpha is dropped unless the target keeps it
  ScaleContext sws(image.width, image.height, AV_PIX_FMT_RGBA, image.width,
                   image.height, spec.pix_fmt, SCALE_FLAGS);
  if (!sws) {
    throw CodecError(
        fmt::format("{}cannot create colour conversion context", prefix(source)),
        source);
  }
  const uint8_t *src_data[4] = {image.pixels.data(), nullptr, nullptr,
                                nullptr};
  int src_stride[4] = {image.width * RGBA_CHANNELS, 0, 0, 0};
  if (sws_scale(sws.get(), src_data, src_stride, 0, image.height, frame->data,
                frame->linesize) <= 0) {
    throw CodecError(
        fmt::format("{}colour conversion failed", prefix(source)), source);
  }

  ret = avcodec_send_frame(enc.get(), frame.get());
  if (ret < 0) {
    throw CodecError(fmt::format("{}{} encode failed: {}", prefix(source),
                                 result.format.name, av_error_string(ret)),
                     source);
  }
  avcodec_send_frame(enc.get(), nullptr);

  Packet pkt;
  if (!pkt) {
    throw CodecError(
        fmt::format("{}cannot allocate packet", prefix(source)), source);
  }
  while ((ret = avcodec_receive_packet(enc.get(), pkt.get())) == 0) {
    result.bytes.insert(result.bytes.end(), pkt->data, pkt->data + pkt->size);
    av_packet_unref(pkt.get());
  }
  if (ret != AVERROR_EOF || result.bytes.empty()) {
    throw CodecError(fmt::format("{}{} encoder produced no output: {}",
                                 prefix(source), result.format.name,
                                 av_error_string(ret)),
                     source);
  }
  return result;
}

} // namespace snapmerge
