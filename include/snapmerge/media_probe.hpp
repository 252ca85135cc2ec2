/**
 * @file media_probe.hpp
 * @brief Content classifier: decides what an entry is by probing it
 *
 * @details Images and videos are recognized by opening them with FFmpeg's
 *          demuxers, never by trusting the file extension. The extension is
 *          used only afterwards, to decide whether a copied image needs its
 *          correct suffix restored.
 *
 * @attention Every probe is side-effect free and safe to call speculatively:
 *            failures are reported as Kind::Unsupported / std::nullopt and
 *            all FFmpeg handles are closed before returning.
 */

#ifndef SNAPMERGE_MEDIA_PROBE_HPP
#define SNAPMERGE_MEDIA_PROBE_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "types.hpp"

namespace snapmerge {

/**
 * @struct EntryProbe
 * @brief Kind of an entry plus the detected image format when it is one.
 */
struct EntryProbe {
  Kind kind = Kind::Unsupported;
  std::optional<ImageFormat> image_format;
};

/**
 * @brief Classify a path, returning the detected image format as well.
 * @note Order: directory, archive (by extension), image, video.
 */
EntryProbe inspect(const std::filesystem::path &path);

/**
 * @brief Classify a path as Image, Video, Archive, Directory or Unsupported.
 * @note Never throws; nonexistent paths are Unsupported.
 */
Kind classify(const std::filesystem::path &path);

/**
 * @brief Probe a file as a still image.
 * @return Dimensions and format, or std::nullopt if it is not an image
 */
std::optional<ImageInfo> probe_image(const std::filesystem::path &path);

/**
 * @brief Probe a file as a video.
 * @return Display size, duration, rotation and audio presence, or
 *         std::nullopt if it is not a video
 */
std::optional<VideoInfo> probe_video(const std::filesystem::path &path);

/**
 * @brief Detected image format of a file.
 * @throws UnsupportedMediaError if the file is not an image
 */
ImageFormat image_format(const std::filesystem::path &path);

/**
 * @brief Lowercase format name of an image ("jpeg", "png", ...).
 * @throws UnsupportedMediaError if the file is not an image
 */
std::string image_extension(const std::filesystem::path &path);

/**
 * @brief Image format descriptor for a format name.
 * @return std::nullopt for names not known to the classifier
 */
std::optional<ImageFormat> image_format_by_name(const std::string &name);

/**
 * @brief Whether the file name's extension is one of the format's
 *        accepted extensions (case-insensitive).
 */
bool has_matching_extension(const std::filesystem::path &path,
                            const ImageFormat &format);

/**
 * @brief Whether an extension names a media or archive format.
 * @note Used to reject output base paths that already carry an extension.
 */
bool is_known_media_extension(const std::string &extension);

} // namespace snapmerge

#endif // SNAPMERGE_MEDIA_PROBE_HPP
