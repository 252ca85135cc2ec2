/**
 * @file compositor.hpp
 * @brief Burns an overlay into an image or a video
 *
 * @details Image media is composited in-process (FFmpeg decode, libswscale
 *          resize, "over" blend, FFmpeg encode in the media's own format).
 *          Video media is handed to the ffmpeg executable and always comes
 *          out as MP4.
 *
 * @attention The overlay is scaled to the media, never the reverse, so the
 *            output always has the media's dimensions.
 */

#ifndef SNAPMERGE_COMPOSITOR_HPP
#define SNAPMERGE_COMPOSITOR_HPP

#include <filesystem>

namespace snapmerge {

/**
 * @brief Composite overlay on top of media and write the result.
 *
 * @param media Base image or video
 * @param overlay Transparent overlay image
 * @param output_base Output path without extension; the extension is chosen
 *        from the media's format (".png", ".jpg", ..., ".mp4")
 * @return Path of the written file
 *
 * @throws NotFoundError if media or overlay is not a regular file
 * @throws InvalidArgumentError if output_base already ends in a media or
 *         archive extension
 * @throws UnsupportedMediaError if the overlay is not an image, or the media
 *         is neither an image nor a video
 * @throws CodecError on decode/encode failure
 */
std::filesystem::path combine(const std::filesystem::path &media,
                              const std::filesystem::path &overlay,
                              const std::filesystem::path &output_base);

} // namespace snapmerge

#endif // SNAPMERGE_COMPOSITOR_HPP
