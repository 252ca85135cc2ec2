/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/snapmerge.env for documentation of each parameter.
 *
 */

#ifndef SNAPMERGE_CONFIG_HPP
#define SNAPMERGE_CONFIG_HPP

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "errors.hpp"

namespace snapmerge {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @throws InvalidArgumentError if the value is not an integer
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  std::string text(val);
  std::size_t used = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(text, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used != text.size()) {
    throw InvalidArgumentError(
        std::string(name) + "=" + text + ": expected an integer", {});
  }
  return parsed;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- BATCH PROCESSING ----**

/**
 * @brief Number of entries processed concurrently.
 * @note 1 = strictly sequential (default)
 *       0 = auto-detect from the cgroup-aware CPU limit
 */
inline int parallel_streams() {
  static int val = get_env_int("PARALLEL_STREAMS", 1);
  return val;
}

/**
 * @brief Stop starting new entries after the first failure.
 * @note The --fail-fast flag overrides this when given.
 */
inline bool fail_fast() {
  static bool val = (get_env_int("FAIL_FAST", 0) != 0);
  return val;
}

/**
 * @brief Root directory for private archive extraction directories.
 */
inline std::string scratch_dir() {
  static std::string val = get_env_string(
      "SCRATCH_DIR", std::filesystem::temp_directory_path().string().c_str());
  return val;
}

// **---- VIDEO ENCODING ----**

/// ffmpeg executable used for the video composite (PATH lookup if bare)
inline std::string ffmpeg_binary() {
  static std::string val = get_env_string("FFMPEG_BINARY", "ffmpeg");
  return val;
}

inline std::string video_codec() {
  static std::string val = get_env_string("VIDEO_CODEC", "libx264");
  return val;
}

inline std::string video_preset() {
  static std::string val = get_env_string("VIDEO_PRESET", "medium");
  return val;
}

/// Constant rate factor for the video encoder (lower = better quality)
inline int video_crf() {
  static int val = get_env_int("VIDEO_CRF", 23);
  return val;
}

inline std::string audio_codec() {
  static std::string val = get_env_string("AUDIO_CODEC", "aac");
  return val;
}

inline std::string audio_bitrate() {
  static std::string val = get_env_string("AUDIO_BITRATE", "192k");
  return val;
}

// **---- IMAGE ENCODING ----**

/**
 * @brief MJPEG quantizer scale for JPEG output (2 = best, 31 = worst)
 */
inline int jpeg_qscale() {
  static int val = get_env_int("JPEG_QSCALE", 2);
  return val;
}

} // namespace Config
} // namespace snapmerge

#endif // SNAPMERGE_CONFIG_HPP
