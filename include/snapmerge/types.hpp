/**
 * @file types.hpp
 * @brief Core data types shared across the pipeline
 *
 * @details Contains:
 *          - Kind: semantic kind of an input entry
 *
 *          - ImageFormat / ImageInfo / VideoInfo: probe results
 *
 *          - Pair: a resolved media + overlay unit of work
 */

#ifndef SNAPMERGE_TYPES_HPP
#define SNAPMERGE_TYPES_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace snapmerge {

// **----- ENTRY KIND -----**

/**
 * @brief Semantic kind of a filesystem entry, derived by probing.
 * @note Never persisted; recomputed on every run.
 */
enum class Kind { Image, Video, Archive, Directory, Unsupported };

/// Lowercase display name of a Kind ("image", "video", ...)
const char *kind_name(Kind kind);

// **----- PROBE RESULTS -----**

/**
 * @struct ImageFormat
 * @brief Still-image container format detected from file content.
 */
struct ImageFormat {
  std::string name;                    //< Lowercase format name, e.g. "jpeg"
  std::string extension;               //< Canonical extension, no dot: "jpg"
  std::vector<std::string> extensions; //< Accepted extensions, with dot
};

struct ImageInfo {
  int width = 0;
  int height = 0;
  ImageFormat format;
};

/**
 * @struct VideoInfo
 * @brief Probed properties of a video file.
 * @note width/height are the displayed frame size, i.e. already swapped when
 *       the stream carries a 90/270 degree rotation.
 */
struct VideoInfo {
  int width = 0;
  int height = 0;
  double duration = 0; //< Seconds
  int rotation = 0;    //< Display rotation in degrees, normalized to [0,360)
  bool has_audio = false;
};

// **----- PAIRING -----**

/**
 * @struct Pair
 * @brief One media file and its overlay, ready to composite.
 * @note overlay is always an image; media is an image or a video.
 */
struct Pair {
  std::filesystem::path media;
  std::filesystem::path overlay;
};

} // namespace snapmerge

#endif // SNAPMERGE_TYPES_HPP
