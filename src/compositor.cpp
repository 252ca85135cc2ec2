/**
 * @file compositor.cpp
 * @brief Image and video compositing implementation
 */

#include "snapmerge/compositor.hpp"

#include <fmt/core.h>

#include "snapmerge/errors.hpp"
#include "snapmerge/image_codec.hpp"
#include "snapmerge/logging.hpp"
#include "snapmerge/media_probe.hpp"
#include "snapmerge/system.hpp"
#include "snapmerge/video_overlay.hpp"

namespace snapmerge {

namespace fs = std::filesystem;

namespace {

void require_file(const fs::path &path, const char *role) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw NotFoundError(
        fmt::format("{}: {} file does not exist", path.string(), role), path);
  }
}

fs::path with_extension(const fs::path &base, const std::string &ext) {
  return fs::path(base.string() + "." + ext);
}

fs::path combine_image(const fs::path &media, const fs::path &overlay,
                       const ImageFormat &format, const fs::path &output_base) {
  TIMER_START(image_decode);
  RgbaImage base = decode_image(media);
  RgbaImage layer = decode_image(overlay);
  TIMER_END(image_decode);

  if (layer.width != base.width || layer.height != base.height) {
    LOG_DEBUG("Resizing overlay {}x{} -> {}x{}", layer.width, layer.height,
              base.width, base.height);
    TIMER_START(image_resize);
    layer = resize_image(layer, base.width, base.height, overlay);
    TIMER_END(image_resize);
  }

  TIMER_START(image_composite);
  alpha_composite(base, layer, media);
  TIMER_END(image_composite);

  TIMER_START(image_encode);
  EncodedImage encoded = encode_image(base, format, media);
  fs::path output = with_extension(output_base, encoded.format.extension);
  write_file_atomically(output, encoded.bytes);
  TIMER_END(image_encode);

  return output;
}

fs::path combine_video(const fs::path &media, const fs::path &overlay,
                       const VideoInfo &video, const ImageInfo &overlay_info,
                       const fs::path &output_base) {
  PendingOutput pending(with_extension(output_base, "mp4"));

  TIMER_START(video_overlay);
  execute_ffmpeg_overlay(media, overlay, video, overlay_info, pending.temp());
  TIMER_END(video_overlay);

  pending.commit();
  return pending.final_path();
}

} // anonymous namespace

fs::path combine(const fs::path &media, const fs::path &overlay,
                 const fs::path &output_base) {
  require_file(media, "media");
  require_file(overlay, "overlay");

  if (output_base.empty() || output_base.filename().empty()) {
    throw InvalidArgumentError("output base path is empty", output_base);
  }
  if (is_known_media_extension(output_base.extension().string())) {
    throw InvalidArgumentError(
        fmt::format("{}: output base must not carry an extension",
                    output_base.string()),
        output_base);
  }

  auto overlay_info = probe_image(overlay);
  if (!overlay_info) {
    throw UnsupportedMediaError(
        fmt::format("{}: overlay is not an image", overlay.string()), overlay);
  }

  if (output_base.has_parent_path()) {
    fs::create_directories(output_base.parent_path());
  }

  if (auto image = probe_image(media)) {
    fs::path out = combine_image(media, overlay, image->format, output_base);
    LOG_DEBUG("Composited image {} -> {}", media.filename().string(),
              out.filename().string());
    return out;
  }

  if (auto video = probe_video(media)) {
    fs::path out =
        combine_video(media, overlay, *video, *overlay_info, output_base);
    LOG_DEBUG("Composited video {} -> {}", media.filename().string(),
              out.filename().string());
    return out;
  }

  throw UnsupportedMediaError(
      fmt::format("{}: media is neither an image nor a video", media.string()),
      media);
}

} // namespace snapmerge
