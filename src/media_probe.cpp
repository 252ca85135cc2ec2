/**
 * @file media_probe.cpp
 * @brief Content classifier implementation
 *
 * @details FFmpeg can open a PNG or JPEG as a one-frame "video", so still
 *          images are recognized first, by the demuxer family (image2,
 *          *_pipe, gif, apng) combined with an image codec on the stream.
 *          Everything else with a real video stream is a video.
 */

#include "snapmerge/media_probe.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

extern "C" {
#include <libavutil/display.h>
}

#include "snapmerge/archive.hpp"
#include "snapmerge/av_handles.hpp"
#include "snapmerge/errors.hpp"
#include "snapmerge/logging.hpp"
#include "snapmerge/system.hpp"

namespace snapmerge {

namespace fs = std::filesystem;

// **---- Format Table ----**

namespace {

struct FormatEntry {
  AVCodecID codec;
  const char *name;
  const char *extension;
  std::vector<std::string> extensions;
};

const std::vector<FormatEntry> &format_table() {
  static const std::vector<FormatEntry> table = {
      {AV_CODEC_ID_MJPEG, "jpeg", "jpg", {".jpg", ".jpeg", ".jpe", ".jfif"}},
      {AV_CODEC_ID_PNG, "png", "png", {".png"}},
      {AV_CODEC_ID_APNG, "png", "png", {".png", ".apng"}},
      {AV_CODEC_ID_BMP, "bmp", "bmp", {".bmp"}},
      {AV_CODEC_ID_TIFF, "tiff", "tif", {".tif", ".tiff"}},
      {AV_CODEC_ID_GIF, "gif", "gif", {".gif"}},
      {AV_CODEC_ID_WEBP, "webp", "webp", {".webp"}},
  };
  return table;
}

const FormatEntry *find_format(AVCodecID codec) {
  for (const auto &entry : format_table()) {
    if (entry.codec == codec)
      return &entry;
  }
  return nullptr;
}

ImageFormat to_image_format(const FormatEntry &entry) {
  return ImageFormat{entry.name, entry.extension, entry.extensions};
}

/// Demuxers that FFmpeg uses for single still-image files
bool is_image_demuxer(const char *name) {
  if (!name)
    return false;
  std::string n(name);
  if (n == "image2" || n == "gif" || n == "apng")
    return true;
  const std::string pipe = "_pipe";
  return n.size() > pipe.size() &&
         n.compare(n.size() - pipe.size(), pipe.size(), pipe) == 0;
}

bool is_regular_file(const fs::path &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && fs::file_size(path, ec) > 0 && !ec;
}

/// Rotation in degrees [0,360) from the stream's display matrix, 0 if none
int stream_rotation(const AVStream *st) {
  const int32_t *matrix = nullptr;
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(60, 29, 100)
  const AVPacketSideData *sd = av_packet_side_data_get(
      st->codecpar->coded_side_data, st->codecpar->nb_coded_side_data,
      AV_PKT_DATA_DISPLAYMATRIX);
  if (sd)
    matrix = reinterpret_cast<const int32_t *>(sd->data);
#else
  matrix = reinterpret_cast<const int32_t *>(
      av_stream_get_side_data(st, AV_PKT_DATA_DISPLAYMATRIX, nullptr));
#endif
  if (!matrix)
    return 0;

  double angle = av_display_rotation_get(matrix);
  if (std::isnan(angle))
    return 0;
  /// av_display_rotation_get is counter-clockwise; players rotate clockwise
  int rot = static_cast<int>(std::lround(-angle));
  return ((rot % 360) + 360) % 360;
}

} // anonymous namespace

// **---- Kind ----**

const char *kind_name(Kind kind) {
  switch (kind) {
  case Kind::Image:
    return "image";
  case Kind::Video:
    return "video";
  case Kind::Archive:
    return "archive";
  case Kind::Directory:
    return "directory";
  case Kind::Unsupported:
    break;
  }
  return "unsupported";
}

// **---- Probing ----**

std::optional<ImageInfo> probe_image(const fs::path &path) {
  if (!is_regular_file(path))
    return std::nullopt;

  InputFile input;
  if (input.open(path) < 0)
    return std::nullopt;
  if (!is_image_demuxer(input->iformat->name))
    return std::nullopt;

  int idx = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1,
                                nullptr, 0);
  if (idx < 0)
    return std::nullopt;

  const AVCodecParameters *par = input->streams[idx]->codecpar;
  const FormatEntry *entry = find_format(par->codec_id);
  if (!entry || par->width <= 0 || par->height <= 0)
    return std::nullopt;

  ImageInfo info;
  info.width = par->width;
  info.height = par->height;
  info.format = to_image_format(*entry);
  return info;
}

std::optional<VideoInfo> probe_video(const fs::path &path) {
  if (!is_regular_file(path))
    return std::nullopt;

  InputFile input;
  if (input.open(path) < 0)
    return std::nullopt;

  const char *demuxer = input->iformat->name;
  if (is_image_demuxer(demuxer) || std::strcmp(demuxer, "tty") == 0)
    return std::nullopt;

  int idx = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1,
                                nullptr, 0);
  if (idx < 0)
    return std::nullopt;

  const AVStream *st = input->streams[idx];
  /// Cover art in audio files shows up as a one-frame video stream
  if (st->disposition & AV_DISPOSITION_ATTACHED_PIC)
    return std::nullopt;
  if (st->codecpar->width <= 0 || st->codecpar->height <= 0)
    return std::nullopt;

  VideoInfo info;
  info.width = st->codecpar->width;
  info.height = st->codecpar->height;
  info.rotation = stream_rotation(st);
  if (info.rotation == 90 || info.rotation == 270) {
    std::swap(info.width, info.height);
  }

  if (input->duration != AV_NOPTS_VALUE && input->duration > 0) {
    info.duration = input->duration / static_cast<double>(AV_TIME_BASE);
  } else if (st->duration != AV_NOPTS_VALUE && st->duration > 0) {
    info.duration = st->duration * av_q2d(st->time_base);
  }

  info.has_audio = av_find_best_stream(input.get(), AVMEDIA_TYPE_AUDIO, -1,
                                       -1, nullptr, 0) >= 0;
  return info;
}

// **---- Classification ----**

EntryProbe inspect(const fs::path &path) {
  EntryProbe probe;
  std::error_code ec;
  auto status = fs::status(path, ec);
  if (ec || !fs::exists(status))
    return probe;

  if (fs::is_directory(status)) {
    probe.kind = Kind::Directory;
    return probe;
  }
  if (!fs::is_regular_file(status))
    return probe;

  if (is_archive_path(path)) {
    probe.kind = Kind::Archive;
    return probe;
  }

  if (auto image = probe_image(path)) {
    probe.kind = Kind::Image;
    probe.image_format = image->format;
    return probe;
  }
  if (probe_video(path)) {
    probe.kind = Kind::Video;
    return probe;
  }

  LOG_DEBUG("{} is neither an image nor a video", path.string());
  return probe;
}

Kind classify(const fs::path &path) { return inspect(path).kind; }

ImageFormat image_format(const fs::path &path) {
  auto info = probe_image(path);
  if (!info) {
    throw UnsupportedMediaError(
        path.string() + ": not a decodable image", path);
  }
  return info->format;
}

std::string image_extension(const fs::path &path) {
  return image_format(path).name;
}

std::optional<ImageFormat> image_format_by_name(const std::string &name) {
  std::string lowered = to_lower(name);
  for (const auto &entry : format_table()) {
    if (lowered == entry.name)
      return to_image_format(entry);
  }
  return std::nullopt;
}

bool has_matching_extension(const fs::path &path, const ImageFormat &format) {
  std::string ext = to_lower(path.extension().string());
  return std::find(format.extensions.begin(), format.extensions.end(), ext) !=
         format.extensions.end();
}

bool is_known_media_extension(const std::string &extension) {
  static const std::vector<std::string> other = {
      ".mp4", ".mov", ".m4v", ".avi", ".mkv", ".webm", ".3gp",
      ".zip", ".tar", ".gz",  ".tgz"};
  std::string ext = to_lower(extension);
  if (ext.empty())
    return false;
  if (ext.front() != '.')
    ext.insert(ext.begin(), '.');

  for (const auto &entry : format_table()) {
    if (std::find(entry.extensions.begin(), entry.extensions.end(), ext) !=
        entry.extensions.end())
      return true;
  }
  return std::find(other.begin(), other.end(), ext) != other.end();
}

} // namespace snapmerge
