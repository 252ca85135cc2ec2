/**
 * @file video_overlay.cpp
 * @brief FFmpeg overlay execution implementation
 */

#include "snapmerge/video_overlay.hpp"

#include <fmt/core.h>

#include "snapmerge/config.hpp"
#include "snapmerge/errors.hpp"
#include "snapmerge/logging.hpp"
#include "snapmerge/system.hpp"

namespace snapmerge {

namespace fs = std::filesystem;

std::string build_overlay_filter(const VideoInfo &video, int overlay_width,
                                 int overlay_height) {
  /// Keep the overlay's alpha through scaling
  std::string overlay_chain = "[1:v]format=rgba";
  if (overlay_width != video.width || overlay_height != video.height) {
    overlay_chain += fmt::format(",scale={}:{}", video.width, video.height);
  }
  overlay_chain += "[ov]";

  std::string graph =
      overlay_chain + ";[0:v][ov]overlay=x=(main_w-overlay_w)/2:"
                      "y=(main_h-overlay_h)/2:shortest=1:format=auto";

  /// yuv420p needs even dimensions
  if (video.width % 2 != 0 || video.height % 2 != 0) {
    graph += ",scale=trunc(iw/2)*2:trunc(ih/2)*2";
  }
  graph += "[v]";
  return graph;
}

void execute_ffmpeg_overlay(const fs::path &media, const fs::path &overlay,
                            const VideoInfo &video,
                            const ImageInfo &overlay_info,
                            const fs::path &output) {
  const std::string ffmpeg = Config::ffmpeg_binary();
  if (!executable_available(ffmpeg)) {
    throw CodecError(
        fmt::format("{}: ffmpeg executable '{}' not found (set FFMPEG_BINARY)",
                    media.string(), ffmpeg),
        media);
  }

  /// Hold the still overlay for the full clip; without a known duration the
  /// overlay filter's shortest=1 ends it with the video instead
  std::string overlay_input = "-loop 1 ";
  if (video.duration > 0) {
    overlay_input += fmt::format("-t {:.3f} ", video.duration);
  }

  std::string cmd = fmt::format(
      "{} -y -hide_banner -nostdin -loglevel error "
      "-i {} {}-i {} "
      "-filter_complex {} -map {} -map {} "
      "-c:v {} -preset {} -crf {} -pix_fmt yuv420p "
      "-c:a {} -b:a {} "
      "-movflags +faststart -f mp4 {}",
      shell_quote(ffmpeg), shell_quote(media.string()), overlay_input,
      shell_quote(overlay.string()),
      shell_quote(build_overlay_filter(video, overlay_info.width,
                                       overlay_info.height)),
      shell_quote("[v]"), shell_quote("0:a?"), shell_quote(Config::video_codec()),
      shell_quote(Config::video_preset()), Config::video_crf(),
      shell_quote(Config::audio_codec()), shell_quote(Config::audio_bitrate()),
      shell_quote(output.string()));

  LOG_DEBUG("[FFmpeg] Compositing {} over {} ({}x{}, {:.2f}s, audio: {})",
            overlay.filename().string(), media.filename().string(),
            video.width, video.height, video.duration,
            video.has_audio ? "yes" : "no");

  int status = run_command(cmd);
  if (status != 0) {
    throw CodecError(fmt::format("{}: ffmpeg overlay failed with status {}",
                                 media.string(), status),
                     media);
  }
}

} // namespace snapmerge
